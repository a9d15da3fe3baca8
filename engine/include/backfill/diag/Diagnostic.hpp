// engine/include/backfill/diag/Diagnostic.hpp
#pragma once
#include <backfill/diag/DiagCode.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>


namespace backfill::diag {

    struct Diagnostic {
        Severity severity = Severity::kError;
        Code code = Code::kNotFoundOrAmbiguous;
        std::string file{};
        uint32_t line = 0;        // 0 = no line information
        std::string message{};
    };

    class Bag {
    public:
        void add(Diagnostic d) {
            if (d.severity == Severity::kError) ++error_count_;
            else ++warning_count_;
            diags_.push_back(std::move(d));
        }

        void add(Severity sev, Code code, std::string file, uint32_t line, std::string message) {
            add(Diagnostic{sev, code, std::move(file), line, std::move(message)});
        }

        bool has_error() const {  return error_count_ != 0;  }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code == c) return true;
            }
            return false;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const    {  return error_count_;    }
        uint32_t warning_count() const  {  return warning_count_;  }

        std::string render_text() const;

    private:
        std::vector<Diagnostic> diags_;
        uint32_t error_count_ = 0;
        uint32_t warning_count_ = 0;
    };

} // namespace backfill::diag
