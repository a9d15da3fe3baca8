// engine/src/region/region_map.cpp
#include <backfill/region/RegionMap.hpp>

#include <cctype>
#include <string>


namespace backfill::region {

    namespace {

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
        }

        bool is_ident_start(char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return std::isalpha(u) || c == '_';
        }

        bool is_ident_cont(char c) {
            unsigned char u = static_cast<unsigned char>(c);
            return std::isalnum(u) || c == '_';
        }

        bool is_identifier(std::string_view s) {
            if (s.empty() || !is_ident_start(s[0])) return false;
            for (char c : s) {
                if (!is_ident_cont(c)) return false;
            }
            return true;
        }

        bool is_integer(std::string_view s) {
            if (!s.empty() && (s[0] == '-' || s[0] == '+')) s.remove_prefix(1);
            if (s.empty()) return false;
            for (char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
            while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
            return s;
        }

        std::vector<std::string_view> split_words(std::string_view s) {
            std::vector<std::string_view> out;
            size_t i = 0;
            while (i < s.size()) {
                while (i < s.size() && is_space(s[i])) ++i;
                const size_t b = i;
                while (i < s.size() && !is_space(s[i])) ++i;
                if (i > b) out.push_back(s.substr(b, i - b));
            }
            return out;
        }

        /// @brief `<head>:` with nothing after the colon; returns the trimmed head.
        bool strip_block_colon(std::string_view line, std::string_view& head) {
            std::string_view t = trim(line);
            if (t.empty() || t.back() != ':') return false;
            t.remove_suffix(1);
            head = trim(t);
            return !head.empty();
        }

        bool is_blank_or_comment(std::string_view line) {
            std::string_view t = trim(line);
            return t.empty() || t.front() == '#';
        }

        std::vector<std::string_view> split_lines(std::string_view s) {
            std::vector<std::string_view> lines;
            size_t b = 0;
            for (size_t i = 0; i < s.size(); ++i) {
                if (s[i] == '\n') {
                    std::string_view ln = s.substr(b, i - b);
                    if (!ln.empty() && ln.back() == '\r') ln.remove_suffix(1);
                    lines.push_back(ln);
                    b = i + 1;
                }
            }
            std::string_view last = s.substr(b);
            if (!last.empty() && last.back() == '\r') last.remove_suffix(1);
            lines.push_back(last);
            return lines;
        }

        template <typename Pred>
        void scan_with(const std::vector<std::string_view>& lines, Pred pred, RegionKind kind,
                       std::vector<Region>& out) {
            const size_t n = lines.size();
            size_t i = 0;
            while (i < n) {
                if (!pred(lines[i])) {
                    ++i;
                    continue;
                }

                const uint32_t base = indent_width(lines[i]);
                size_t j = i + 1;
                while (j < n) {
                    if (is_blank_or_comment(lines[j])) {
                        ++j;
                        continue;
                    }
                    if (indent_width(lines[j]) <= base) break;
                    ++j;
                }

                out.push_back(Region{kind, static_cast<uint32_t>(i + 1), static_cast<uint32_t>(j)});
                i = j;
            }
        }

        bool line_in(const Region& r, uint32_t line) {
            return r.start_line <= line && line <= r.end_line;
        }

    } // namespace

    std::string_view kind_name(RegionKind k) {
        switch (k) {
            case RegionKind::kRoot: return "root";
            case RegionKind::kLabelBlock: return "label";
            case RegionKind::kScreenBlock: return "screen";
            case RegionKind::kProtectedCode: return "python";
        }
        return "root";
    }

    uint32_t indent_width(std::string_view line) {
        uint32_t n = 0;
        for (char c : line) {
            if (c != ' ' && c != '\t') break;
            ++n;
        }
        return n;
    }

    bool is_protected_opener(std::string_view line) {
        std::string_view head;
        if (!strip_block_colon(line, head)) return false;

        const auto w = split_words(head);
        size_t i = 0;
        if (i < w.size() && w[i] == "init") {
            ++i;
            if (i < w.size() && is_integer(w[i])) ++i;
        }
        if (i >= w.size() || w[i] != "python") return false;
        ++i;

        // python [early] [hide] [in <store>]
        if (i < w.size() && w[i] == "early") ++i;
        if (i < w.size() && w[i] == "hide") ++i;
        if (i + 1 < w.size() && w[i] == "in" && is_identifier(w[i + 1])) i += 2;
        return i == w.size();
    }

    bool is_label_opener(std::string_view line) {
        std::string_view head;
        if (!strip_block_colon(line, head)) return false;

        const auto w = split_words(head);
        return w.size() == 2 && w[0] == "label" && is_identifier(w[1]);
    }

    bool is_screen_opener(std::string_view line) {
        std::string_view head;
        if (!strip_block_colon(line, head)) return false;

        constexpr std::string_view kw = "screen";
        if (head.substr(0, kw.size()) != kw) return false;
        std::string_view rest = head.substr(kw.size());
        if (rest.empty() || !is_space(rest.front())) return false;
        rest = trim(rest);
        return !rest.empty() && is_ident_start(rest.front());
    }

    RegionMap RegionMap::classify(std::string_view source) {
        const auto lines = split_lines(source);

        RegionMap m;
        scan_with(lines, is_protected_opener, RegionKind::kProtectedCode, m.regions_);
        scan_with(lines, is_screen_opener, RegionKind::kScreenBlock, m.regions_);
        scan_with(lines, is_label_opener, RegionKind::kLabelBlock, m.regions_);
        return m;
    }

    RegionKind RegionMap::kind_of_line(uint32_t line) const {
        static constexpr RegionKind k_priority[] = {
            RegionKind::kProtectedCode,
            RegionKind::kScreenBlock,
            RegionKind::kLabelBlock,
        };

        for (RegionKind k : k_priority) {
            for (const auto& r : regions_) {
                if (r.kind == k && line_in(r, line)) return k;
            }
        }
        return RegionKind::kRoot;
    }

} // namespace backfill::region
