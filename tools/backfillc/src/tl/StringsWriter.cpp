// tools/backfillc/src/tl/StringsWriter.cpp
#include <backfillc/tl/StringsWriter.hpp>

#include <backfill/patch/Replacer.hpp>

#include <set>
#include <unordered_map>


namespace backfillc::tl {

    namespace {

        bool is_blank(std::string_view s) {
            for (char c : s) {
                if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
            }
            return true;
        }

        std::string file_of(const records::Record& r) {
            if (!r.file.empty()) return r.file;
            const auto colon = r.unit.id.find(':');
            if (colon == std::string::npos || colon == 0) return {};
            return r.unit.id.substr(0, colon);
        }

        // comments stay on one line
        std::string one_line(std::string s) {
            std::string out;
            out.reserve(s.size());
            for (char c : s) {
                if (c == '\n') out += "\\n";
                else if (c != '\r') out.push_back(c);
            }
            return out;
        }

        std::string render_conflicts(const std::set<std::string>& all) {
            std::string out = "[";
            bool first = true;
            for (const auto& s : all) {
                if (!first) out += ", ";
                first = false;
                out += one_line(quote_block(s));
            }
            out += "]";
            return out;
        }

    } // namespace

    std::map<std::string, std::vector<StringsPair>> group_pairs(const records::RecordSet& set, bool per_file) {
        std::map<std::string, std::vector<StringsPair>> out;
        for (const auto& r : set.records) {
            const std::string rel = file_of(r);
            if (rel.empty()) continue;
            out[per_file ? rel : std::string{}].push_back(
                StringsPair{r.unit.original_text, r.unit.translated_text, r.unit.id});
        }
        return out;
    }

    std::string quote_block(std::string_view body) {
        using backfill::QuoteStyle;
        if (body.find('\n') != std::string_view::npos) {
            return "\"\"\"" + backfill::patch::quote_safe(body, QuoteStyle::kTripleDouble) + "\"\"\"";
        }
        return "\"" + backfill::patch::quote_safe(body, QuoteStyle::kDouble) + "\"";
    }

    std::string build_strings(const std::vector<StringsPair>& pairs, std::string_view lang) {
        struct Entry {
            std::string old_text;
            std::string new_text;
            std::set<std::string> conflicts;
        };

        std::vector<Entry> entries;
        std::unordered_map<std::string, size_t> by_old;
        for (const auto& p : pairs) {
            const auto it = by_old.find(p.old_text);
            if (it == by_old.end()) {
                by_old.emplace(p.old_text, entries.size());
                entries.push_back(Entry{p.old_text, p.new_text, {}});
                continue;
            }
            Entry& e = entries[it->second];
            if (e.new_text != p.new_text) {
                e.conflicts.insert(e.new_text);
                e.conflicts.insert(p.new_text);
            }
        }

        std::string out = "translate " + std::string(lang) + " strings:\n";
        for (const auto& e : entries) {
            if (is_blank(e.old_text)) continue;
            out += "\n";
            if (!e.conflicts.empty()) {
                out += "    # CONFLICT for old: " + one_line(quote_block(e.old_text)) + " -> " + render_conflicts(e.conflicts) + "\n";
            }
            out += "    old " + quote_block(e.old_text) + "\n";
            out += "    new " + quote_block(e.new_text) + "\n";
        }
        return out;
    }

    std::filesystem::path strings_path(const std::filesystem::path& out_root, std::string_view lang, std::string_view rel) {
        const std::filesystem::path dir = out_root / "game" / "tl" / std::string(lang);
        if (rel.empty()) return dir / "strings.rpy";

        std::filesystem::path p{std::string(rel)};
        p.replace_extension(".rpy");
        return dir / p;
    }

} // namespace backfillc::tl
