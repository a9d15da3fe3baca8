// engine/include/backfill/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace backfill::diag {

    enum class Severity : uint8_t {
        kWarning,
        kError,
    };

    enum class Code : uint16_t {
        // per-unit resolution (engine)
        kNotFoundOrAmbiguous,      // no tier produced a unique candidate
        kProtectedRegionSkip,      // the unique candidate sits inside a python block
        kPlaceholderMismatch,      // args[0]=original set, args[1]=translated set
        kMalformedUnit,            // unit lacks id / original / translation

        // translation records (tool)
        kBadJsonLine,
        kRecordMissingId,
        kRecordMissingTranslation,

        // files (tool)
        kFileReadFailed,
        kFileWriteFailed,
        kUnsafeOutputPath,
        kReportWriteFailed,
        kInvalidUtf8,

        // configuration (tool)
        kConfigParseFailed,
        kConfigUnknownKey,
        kConfigTypeMismatch,
    };

} // namespace backfill::diag
