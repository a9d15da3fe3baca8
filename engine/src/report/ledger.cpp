// engine/src/report/ledger.cpp
#include <backfill/report/Ledger.hpp>

#include <iterator>


namespace backfill::report {

    std::string_view status_name(Status s) {
        switch (s) {
            case Status::kOk: return "OK";
            case Status::kNoop: return "NOOP";
            case Status::kWarn: return "WARN";
            case Status::kFail: return "FAIL";
        }
        return "FAIL";
    }

    void Ledger::append(Ledger&& other) {
        rows_.insert(rows_.end(),
                     std::make_move_iterator(other.rows_.begin()),
                     std::make_move_iterator(other.rows_.end()));
        other.rows_.clear();
    }

    size_t Ledger::count(Status s) const {
        size_t n = 0;
        for (const auto& r : rows_) {
            if (r.status == s) ++n;
        }
        return n;
    }

    std::string escape_tsv_field(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '\t': out += "\\t"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\\': out += "\\\\"; break;
                default: out.push_back(c); break;
            }
        }
        return out;
    }

    std::string render_tsv(const Ledger& ledger) {
        std::string out = "id\tfile\tstatus\tmethod\tmessage\n";
        for (const auto& r : ledger.rows()) {
            out += escape_tsv_field(r.unit_id);
            out += '\t';
            out += escape_tsv_field(r.file);
            out += '\t';
            out += status_name(r.status);
            out += '\t';
            out += escape_tsv_field(r.method);
            out += '\t';
            out += escape_tsv_field(r.message);
            out += '\n';
        }
        return out;
    }

} // namespace backfill::report
