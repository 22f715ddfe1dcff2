#include "pipeline/record_assembler.h"
#include "common/logger.hpp"
#include "mrz/mrz_parser.h"
#include "preprocessing/image_ops.h"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace passport {

void AssemblerConfig::Show() const {
    LOG_INFO("AssemblerConfig:");
    LOG_INFO("  centuryPivot={}, minCharConfidence={:.2f}", centuryPivot, minCharConfidence);
    LOG_INFO("  thumbnail {}px q{}, full image {}px q{}",
             thumbnailMaxSide, thumbnailQuality, fullImageMaxSide, fullImageQuality);
}

RecordAssembler::RecordAssembler(const AssemblerConfig& config)
    : config_(config) {
}

std::string RecordAssembler::formatDate(const std::string& yymmdd, int centuryPivot) {
    if (!MrzParser::isPlausibleDate(yymmdd)) {
        return yymmdd;
    }
    int yy = std::stoi(yymmdd.substr(0, 2));
    int year = yy <= centuryPivot ? 2000 + yy : 1900 + yy;
    return yymmdd.substr(4, 2) + "/" + yymmdd.substr(2, 2) + "/" + std::to_string(year);
}

void RecordAssembler::updateConfidence(PassportRecord& record) {
    record.updateConfidence();
}

bool RecordAssembler::ocrConfidenceLow(const MRZBlock& block, const MRZField& field) const {
    auto mean = block.meanConfidence(field.line, field.begin, field.length);
    return mean && *mean < config_.minCharConfidence;
}

PassportRecord RecordAssembler::assemble(const ParsedMrz& parsed, const MRZBlock& block,
                                         const PassportImageRegion& region) const {
    PassportRecord record;
    record.sourcePage = region.pageIndex;
    record.regionIndex = region.regionIndex;
    record.mrzFound = true;

    auto get = [&parsed](const char* name) -> const MRZField& {
        const MRZField* f = parsed.find(name);
        if (!f) {
            throw std::logic_error(std::string("parser did not produce field ") + name);
        }
        return *f;
    };

    const MRZField& surname = get(mrz_field::kSurname);
    const MRZField& given = get(mrz_field::kGivenNames);
    const MRZField& passportNumber = get(mrz_field::kPassportNumber);
    const MRZField& nationality = get(mrz_field::kNationality);
    const MRZField& birth = get(mrz_field::kDateOfBirth);
    const MRZField& sex = get(mrz_field::kSex);

    record.lastName = surname.value;
    std::istringstream tokens(given.value);
    std::string token;
    if (tokens >> token) {
        record.firstName = token;
    }
    while (tokens >> token) {
        if (!record.middleName.empty()) record.middleName += ' ';
        record.middleName += token;
    }
    record.gender = sex.value;
    record.passportNumber = passportNumber.value;
    record.nationality = nationality.value;
    record.dateOfBirth = formatDate(birth.value, config_.centuryPivot);

    // Checksum / plausibility verdicts from the parser
    struct Mapping {
        const char* recordField;
        const MRZField* mrz;
        bool hasOcrSignal;   // no checksum, so OCR confidence matters
    };
    const Mapping mappings[] = {
        {field::kLastName, &surname, true},
        {field::kFirstName, &given, true},
        {field::kGender, &sex, true},
        {field::kNationality, &nationality, true},
        {field::kPassportNumber, &passportNumber, false},
        {field::kDateOfBirth, &birth, false},
    };
    for (const auto& m : mappings) {
        bool low = m.mrz->confidence == FieldConfidence::Low;
        if (!low && m.hasOcrSignal && ocrConfidenceLow(block, *m.mrz)) {
            LOG_DEBUG("{}: OCR confidence under {:.2f}", m.recordField, config_.minCharConfidence);
            low = true;
        }
        if (low) record.flagLow(m.recordField);
        if (m.mrz->ambiguous) record.ambiguousFields.push_back(m.recordField);
        if (m.mrz->corrected) record.correctedFields.push_back(m.recordField);
    }
    if (!record.middleName.empty() && record.isLowConfidence(field::kFirstName)) {
        record.flagLow(field::kMiddleName);
    }

    // Empty required values are reported as missing, not as low confidence
    for (const char* name : {field::kFirstName, field::kLastName, field::kGender,
                             field::kPassportNumber, field::kNationality, field::kDateOfBirth}) {
        if (record.value(name).empty()) {
            record.flagMissing(name);
        }
    }

    updateConfidence(record);
    attachImages(record, region);

    LOG_DEBUG("Assembled record {}/{}: {} {} [{}] confidence={:.2f} low={}",
              region.pageIndex, region.regionIndex, record.lastName, record.firstName,
              record.passportNumber, record.confidence, record.lowConfidenceFields.size());
    return record;
}

PassportRecord RecordAssembler::placeholder(const PassportImageRegion& region) const {
    PassportRecord record;
    record.sourcePage = region.pageIndex;
    record.regionIndex = region.regionIndex;
    for (const char* name : kRecordFields) {
        record.flagLow(name);
    }
    record.confidence = 0.0f;
    attachImages(record, region);
    return record;
}

void RecordAssembler::attachImages(PassportRecord& record, const PassportImageRegion& region) const {
    if (region.image.empty()) {
        return;
    }
    record.thumbnailJpeg = ImageOps::encodeJpeg(region.image, config_.thumbnailMaxSide,
                                                config_.thumbnailQuality);
    record.fullImageJpeg = ImageOps::encodeJpeg(region.image, config_.fullImageMaxSide,
                                                config_.fullImageQuality);
}

} // namespace passport
