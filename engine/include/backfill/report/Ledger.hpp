// engine/include/backfill/report/Ledger.hpp
#pragma once
#include <backfill/diag/DiagCode.hpp>
#include <backfill/region/RegionMap.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace backfill::report {

    enum class Status : uint8_t {
        kOk,
        kNoop,
        kWarn,
        kFail,
    };

    std::string_view status_name(Status s);

    struct MatchOutcome {
        std::string unit_id{};
        std::string file{};
        Status status = Status::kFail;
        std::string method{};
        region::RegionKind region = region::RegionKind::kRoot;
        std::string message{};
        std::optional<diag::Code> code{};
    };

    /// @brief Append-only outcome rows, one per unit per file.
    class Ledger {
    public:
        void add(MatchOutcome o) {  rows_.push_back(std::move(o));  }

        /// @brief Moves all rows of `other` to the end, keeping their order.
        void append(Ledger&& other);

        const std::vector<MatchOutcome>& rows() const {  return rows_;  }
        size_t size() const {  return rows_.size();  }

        size_t count(Status s) const;

    private:
        std::vector<MatchOutcome> rows_;
    };

    /// @brief Tabs, newlines and backslashes become `\t`, `\n`, `\\`; CR becomes `\r`.
    std::string escape_tsv_field(std::string_view s);

    /// @brief `id\tfile\tstatus\tmethod\tmessage` header plus one line per row.
    std::string render_tsv(const Ledger& ledger);

} // namespace backfill::report
