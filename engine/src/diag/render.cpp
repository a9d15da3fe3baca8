// engine/src/diag/render.cpp
#include <backfill/diag/Render.hpp>

#include <sstream>


namespace backfill::diag {

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kNotFoundOrAmbiguous: return "NOT_FOUND_OR_AMBIGUOUS";
            case Code::kProtectedRegionSkip: return "PROTECTED_REGION_SKIP";
            case Code::kPlaceholderMismatch: return "PLACEHOLDER_MISMATCH";
            case Code::kMalformedUnit: return "MALFORMED_UNIT";
            case Code::kBadJsonLine: return "BAD_JSON_LINE";
            case Code::kRecordMissingId: return "RECORD_MISSING_ID";
            case Code::kRecordMissingTranslation: return "RECORD_MISSING_TRANSLATION";
            case Code::kFileReadFailed: return "FILE_READ_FAILED";
            case Code::kFileWriteFailed: return "FILE_WRITE_FAILED";
            case Code::kUnsafeOutputPath: return "UNSAFE_OUTPUT_PATH";
            case Code::kReportWriteFailed: return "REPORT_WRITE_FAILED";
            case Code::kInvalidUtf8: return "INVALID_UTF8";
            case Code::kConfigParseFailed: return "CONFIG_PARSE_FAILED";
            case Code::kConfigUnknownKey: return "CONFIG_UNKNOWN_KEY";
            case Code::kConfigTypeMismatch: return "CONFIG_TYPE_MISMATCH";
        }
        return "UNKNOWN";
    }

    std::string_view severity_name(Severity s) {
        switch (s) {
            case Severity::kWarning: return "warning";
            case Severity::kError: return "error";
        }
        return "error";
    }

    std::string render_one(const Diagnostic& d) {
        std::ostringstream oss;
        oss << severity_name(d.severity) << "[" << code_name(d.code) << "]: " << d.message;
        if (!d.file.empty()) {
            oss << "\n --> " << d.file;
            if (d.line != 0) oss << ":" << d.line;
        }
        return oss.str();
    }

    std::string Bag::render_text() const {
        std::string out;
        for (const auto& d : diags_) {
            out += render_one(d);
            out += "\n";
        }
        return out;
    }

} // namespace backfill::diag
