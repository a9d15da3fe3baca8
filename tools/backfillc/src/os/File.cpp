// tools/backfillc/src/os/File.cpp
#include <backfillc/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>


namespace backfillc::os {

    namespace fs = std::filesystem;

    bool read_file(const fs::path& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.string().c_str(), "rb");
        if (!fp) {
            out_error = std::string("cannot open file: ") + std::strerror(errno);
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "cannot determine file size";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "short read";
            return false;
        }
        return true;
    }

    bool write_file_atomic(const fs::path& path, std::string_view content, std::string& out_error) {
        out_error.clear();
        if (path.empty()) {
            out_error = "empty output path";
            return false;
        }

        std::error_code ec{};
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                out_error = "failed to create directory: " + path.parent_path().string();
                return false;
            }
        }

        const fs::path tmp = path.string() + ".tmp";
        {
            std::FILE* fp = std::fopen(tmp.string().c_str(), "wb");
            if (!fp) {
                out_error = "failed to open temporary file for write: " + tmp.string() + ": " + std::strerror(errno);
                return false;
            }
            const size_t n = std::fwrite(content.data(), 1, content.size(), fp);
            const bool closed = std::fclose(fp) == 0;
            if (n != content.size() || !closed) {
                fs::remove(tmp, ec);
                out_error = "failed to write temporary file: " + tmp.string();
                return false;
            }
        }

        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(path, ec);
            ec.clear();
            fs::rename(tmp, path, ec);
        }
        if (ec) {
            fs::remove(tmp, ec);
            out_error = "failed to move temporary file to final path: " + path.string();
            return false;
        }
        return true;
    }

    bool backup_existing(const fs::path& path, std::string& out_error) {
        out_error.clear();
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec)) return true;

        const fs::path bak = path.string() + ".bak";
        fs::copy_file(path, bak, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            out_error = "failed to write backup " + bak.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

    bool is_inside(const fs::path& root, const fs::path& path) {
        std::error_code ec{};
        const fs::path r = fs::absolute(root, ec).lexically_normal();
        if (ec) return false;
        const fs::path p = fs::absolute(path, ec).lexically_normal();
        if (ec) return false;

        auto pi = p.begin();
        for (auto ri = r.begin(); ri != r.end(); ++ri, ++pi) {
            // trailing separator of a directory path shows up as an empty last element
            if (ri->empty()) break;
            if (pi == p.end() || *ri != *pi) return false;
        }
        return true;
    }

    std::string relative_generic(const fs::path& root, const fs::path& path) {
        return path.lexically_relative(root).generic_string();
    }

} // namespace backfillc::os
