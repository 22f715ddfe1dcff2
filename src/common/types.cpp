#include "common/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace passport {

namespace {

void addOnce(std::vector<std::string>& list, const std::string& name) {
    if (std::find(list.begin(), list.end(), name) == list.end()) {
        list.push_back(name);
    }
}

void removeAll(std::vector<std::string>& list, const std::string& name) {
    list.erase(std::remove(list.begin(), list.end(), name), list.end());
}

} // namespace

std::string& PassportRecord::mutableValue(const std::string& name) {
    if (name == field::kFirstName) return firstName;
    if (name == field::kMiddleName) return middleName;
    if (name == field::kLastName) return lastName;
    if (name == field::kGender) return gender;
    if (name == field::kPassportNumber) return passportNumber;
    if (name == field::kNationality) return nationality;
    if (name == field::kDateOfBirth) return dateOfBirth;
    throw std::invalid_argument("unknown record field: " + name);
}

const std::string& PassportRecord::value(const std::string& name) const {
    return const_cast<PassportRecord*>(this)->mutableValue(name);
}

void PassportRecord::setValue(const std::string& name, const std::string& newValue) {
    mutableValue(name) = newValue;
    removeAll(lowConfidenceFields, name);
    removeAll(missingFields, name);
    removeAll(ambiguousFields, name);
    updateConfidence();
}

void PassportRecord::updateConfidence() {
    size_t low = 0;
    for (const char* name : kRecordFields) {
        if (isLowConfidence(name)) ++low;
    }
    confidence = static_cast<float>(kRecordFields.size() - low) / kRecordFields.size();
}

bool PassportRecord::isLowConfidence(const std::string& name) const {
    return std::find(lowConfidenceFields.begin(), lowConfidenceFields.end(), name) !=
           lowConfidenceFields.end();
}

void PassportRecord::flagLow(const std::string& name) {
    addOnce(lowConfidenceFields, name);
}

void PassportRecord::flagMissing(const std::string& name) {
    addOnce(missingFields, name);
}

} // namespace passport
