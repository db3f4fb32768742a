#include "fs_util.hpp"

#include <sheetfork-cpp/error.hpp>
#include <sheetfork-cpp/logging.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <random>
#include <system_error>

#include <zlib.h>

namespace sheetfork_cpp::detail {

namespace {

constexpr auto block_size = std::size_t{64} * 1024;
constexpr auto workbook_id_token_len = std::size_t{10};
constexpr char base32_alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

auto crc_bytes(uLong crc, std::string_view bytes) -> uLong {
    return ::crc32(crc, reinterpret_cast<const Bytef*>(bytes.data()),
                   static_cast<uInt>(bytes.size()));
}

auto adler_bytes(uLong adler, std::string_view bytes) -> uLong {
    return ::adler32(adler, reinterpret_cast<const Bytef*>(bytes.data()),
                     static_cast<uInt>(bytes.size()));
}

}  // namespace

auto file_crc32(const std::filesystem::path& path, std::string_view operation) -> std::uint32_t {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) throw io_failure(operation, path.string(), "cannot open file for checksum");

    auto crc = ::crc32(0L, Z_NULL, 0);
    auto buffer = std::array<char, block_size>{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) crc = crc_bytes(crc, std::string_view{buffer.data(), static_cast<std::size_t>(got)});
    }
    if (in.bad()) throw io_failure(operation, path.string(), "read error during checksum");
    return static_cast<std::uint32_t>(crc);
}

auto fingerprint(const std::filesystem::path& path, std::string_view operation) -> FileFingerprint {
    auto ec = std::error_code{};
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw not_found(operation, path.string());
    }
    auto fp = FileFingerprint{};
    fp.size = std::filesystem::file_size(path, ec);
    if (ec) throw io_failure(operation, path.string(), ec.message());
    fp.modified = std::filesystem::last_write_time(path, ec);
    if (ec) throw io_failure(operation, path.string(), ec.message());
    fp.crc32 = file_crc32(path, operation);
    return fp;
}

auto derive_workbook_id(const std::filesystem::path& path,
                        std::uintmax_t size,
                        std::filesystem::file_time_type modified) -> WorkbookId {
    auto key = path.lexically_normal().string();
    key += '\0';
    key += std::to_string(size);
    key += '\0';
    key += std::to_string(modified.time_since_epoch().count());

    // Two independent 32-bit checksums give 64 bits; the top 50 become
    // ten base32 characters.
    auto high = static_cast<std::uint64_t>(crc_bytes(::crc32(0L, Z_NULL, 0), key));
    auto low = static_cast<std::uint64_t>(adler_bytes(::adler32(0L, Z_NULL, 0), key));
    auto value = (high << 32) | low;

    auto token = std::string{};
    token.reserve(workbook_id_token_len);
    for (std::size_t i = 0; i < workbook_id_token_len; ++i) {
        auto shift = 64 - (i + 1) * 5;
        token.push_back(base32_alphabet[(value >> shift) & 31]);
    }
    return WorkbookId{"wb-" + token};
}

auto derive_workbook_id(const std::filesystem::path& path) -> WorkbookId {
    auto ec = std::error_code{};
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return WorkbookId{};
    auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) return WorkbookId{};
    return derive_workbook_id(path, size, modified);
}

void copy_file(const std::filesystem::path& from, const std::filesystem::path& to,
               std::string_view operation) {
    auto ec = std::error_code{};
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw io_failure(operation, from.string(),
                         "copy to " + to.string() + " failed: " + ec.message());
    }
}

void replace_file(const std::filesystem::path& from, const std::filesystem::path& to,
                  std::string_view operation) {
    auto ec = std::error_code{};
    std::filesystem::rename(from, to, ec);
    if (ec) {
        throw io_failure(operation, to.string(),
                         "rename from " + from.string() + " failed: " + ec.message());
    }
}

void log_cleanup_failure(std::string_view context, const char* what) noexcept {
    try {
        SHEETFORK_LOG_ERROR("{}: cleanup aborted: {}", context, what);
    } catch (const std::exception&) {
        // The logger failed the same way; the caller still sees false.
    }
}

auto remove_quietly(const std::filesystem::path& path, std::string_view context) noexcept -> bool {
    try {
        SHEETFORK_LOG_DEBUG("{}: removing {}", context, path.string());
        auto ec = std::error_code{};
        std::filesystem::remove(path, ec);
        if (ec) {
            SHEETFORK_LOG_WARN("{}: failed to remove {}: {}", context, path.string(), ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_cleanup_failure(context, e.what());
        return false;
    }
}

auto remove_tree_quietly(const std::filesystem::path& path, std::string_view context) noexcept -> bool {
    try {
        auto ec = std::error_code{};
        std::filesystem::remove_all(path, ec);
        if (ec) {
            SHEETFORK_LOG_WARN("{}: failed to remove {}: {}", context, path.string(), ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_cleanup_failure(context, e.what());
        return false;
    }
}

auto random_hex(std::size_t count) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto dist = std::uniform_int_distribution<int>{0, 15};
    auto out = std::string{};
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) out.push_back(hex_chars[dist(engine)]);
    return out;
}

auto ascii_lower(std::string_view s) -> std::string {
    auto out = std::string{s};
    std::ranges::transform(out, out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace sheetfork_cpp::detail
