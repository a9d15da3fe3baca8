// engine/src/text/fuzzy.cpp
#include <backfill/text/Fuzzy.hpp>
#include <backfill/text/Utf8.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <string>


namespace backfill::text {

    namespace {

        bool is_ws(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        std::set<std::string> token_set(std::string_view s) {
            std::set<std::string> out;
            size_t i = 0;
            while (i < s.size()) {
                while (i < s.size() && is_ws(s[i])) ++i;
                const size_t b = i;
                while (i < s.size() && !is_ws(s[i])) ++i;
                if (i > b) out.emplace(s.substr(b, i - b));
            }
            return out;
        }

        std::string join(const std::vector<std::string>& v) {
            std::string out;
            for (size_t i = 0; i < v.size(); ++i) {
                if (i) out.push_back(' ');
                out += v[i];
            }
            return out;
        }

        double ratio_from_lengths(size_t lcs, size_t la, size_t lb) {
            if (la + lb == 0) return 100.0;
            return 100.0 * 2.0 * static_cast<double>(lcs) / static_cast<double>(la + lb);
        }

    } // namespace

    size_t lcs_length(const std::vector<uint32_t>& a, const std::vector<uint32_t>& b) {
        const size_t m = b.size();
        std::vector<size_t> prev(m + 1, 0), cur(m + 1, 0);
        for (size_t i = 0; i < a.size(); ++i) {
            cur[0] = 0;
            for (size_t j = 0; j < m; ++j) {
                if (a[i] == b[j]) cur[j + 1] = prev[j] + 1;
                else cur[j + 1] = std::max(cur[j], prev[j + 1]);
            }
            std::swap(prev, cur);
        }
        return prev[m];
    }

    double indel_ratio(std::string_view a, std::string_view b) {
        const auto ca = decode_utf8(a);
        const auto cb = decode_utf8(b);
        return ratio_from_lengths(lcs_length(ca, cb), ca.size(), cb.size());
    }

    double token_set_ratio(std::string_view a, std::string_view b) {
        const auto ta = token_set(a);
        const auto tb = token_set(b);
        if (ta.empty() || tb.empty()) return 0.0;

        std::vector<std::string> sect, diff_ab, diff_ba;
        std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(sect));
        std::set_difference(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(diff_ab));
        std::set_difference(tb.begin(), tb.end(), ta.begin(), ta.end(), std::back_inserter(diff_ba));

        if (!sect.empty() && (diff_ab.empty() || diff_ba.empty())) return 100.0;

        const std::string s_sect = join(sect);
        const std::string s_ab = join(diff_ab);
        const std::string s_ba = join(diff_ba);

        double best = indel_ratio(s_ab, s_ba);
        if (s_sect.empty()) return best;

        // "sect" vs "sect + ' ' + diff": the shared prefix is the whole LCS
        const size_t n_sect = decode_utf8(s_sect).size();
        const size_t n_ab = n_sect + 1 + decode_utf8(s_ab).size();
        const size_t n_ba = n_sect + 1 + decode_utf8(s_ba).size();
        best = std::max(best, ratio_from_lengths(n_sect, n_sect, n_ab));
        best = std::max(best, ratio_from_lengths(n_sect, n_sect, n_ba));
        return best;
    }

} // namespace backfill::text
