#pragma once

#include "ports/output/ISequenceRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/enums/SourceType.hpp"
#include <memory>
#include <string>
#include <sstream>
#include <iomanip>

namespace ledger::application {

/**
 * @brief Номера проводок вида PREFIX-00001
 *
 * Счётчик увеличивается в транзакции вызывающего: откат проводки
 * откатывает и номер, поэтому номера идут без пропусков.
 */
class SequenceGenerator {
public:
    static constexpr int WIDTH = 5;

    explicit SequenceGenerator(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings)) {}

    std::string nextEntryNumber(ports::output::ISequenceRepository& sequences,
                                const std::string& prefix) const {
        return format(prefix, sequences.nextValue(prefix));
    }

    std::string nextEntryNumber(ports::output::ISequenceRepository& sequences,
                                domain::SourceType sourceType) const {
        return nextEntryNumber(sequences, settings_->getPrefix(sourceType));
    }

    static std::string format(const std::string& prefix, int64_t value) {
        std::ostringstream ss;
        ss << prefix << "-" << std::setfill('0') << std::setw(WIDTH) << value;
        return ss.str();
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::application
