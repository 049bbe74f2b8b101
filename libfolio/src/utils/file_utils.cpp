//
// Created by Giuseppe Francione on 05/02/26.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace folio {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts wide-char paths, supporting Unicode and long paths
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file(const std::filesystem::path& path) {
        const unique_FILE in(open_file(path, "rb"));
        if (!in) {
            Logger::log(LogLevel::Error, "Cannot open file: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open file: " + path.string());
        }

        std::vector<unsigned char> data;
        unsigned char buf[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), in.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(in.get())) {
            Logger::log(LogLevel::Error, "Read error on: " + path.string(), "file_utils");
            throw std::runtime_error("Read error on: " + path.string());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<unsigned char>& data) {
        if (path.has_parent_path()) {
            ensure_directory(path.parent_path());
        }

        const unique_FILE out(open_file(path, "wb"));
        if (!out) {
            Logger::log(LogLevel::Error, "Cannot open output: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open output: " + path.string());
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), out.get()) != data.size()) {
            Logger::log(LogLevel::Error, "Short write on: " + path.string(), "file_utils");
            throw std::runtime_error("Short write on: " + path.string());
        }
        if (std::fflush(out.get()) != 0) {
            throw std::runtime_error("Flush failed on: " + path.string());
        }
    }

    std::vector<std::string> read_lines(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            Logger::log(LogLevel::Error, "Cannot open text file: " + path.string(), "file_utils");
            throw std::runtime_error("Cannot open text file: " + path.string());
        }
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
        }
        return lines;
    }

    void ensure_directory(const std::filesystem::path& dir, const std::string_view tag) {
        if (dir.empty()) return;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create directory: " + dir.string() + " (" + ec.message() + ")", tag);
            throw std::runtime_error("Failed to create directory: " + dir.string());
        }
    }

    std::string lowercase_extension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::ranges::transform(ext, ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

} // namespace folio
