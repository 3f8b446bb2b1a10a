#pragma once

#include <textprobe/decoder.h>
#include <textprobe/encoding.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace textprobe {

struct FileViewConfig {
    /// Empty means the default registry.
    std::vector<EncodingCandidate> order;
    /// Record every candidate's verdict in attempts().
    bool trace = false;
};

/// A file's contents decoded for display, or the knowledge that it is binary.
class FileView {
public:
    explicit FileView(const FileViewConfig& config = {});
    ~FileView();

    FileView(FileView&&) noexcept;
    FileView& operator=(FileView&&) noexcept;

    FileView(const FileView&) = delete;
    FileView& operator=(const FileView&) = delete;

    /// Maps the file and decodes it. Throws std::runtime_error if the file
    /// cannot be opened or mapped; leaves the previous contents untouched then.
    void open_file(const std::filesystem::path& path);

    /// Decodes an in-memory buffer, e.g. an archive member. `name` only feeds
    /// path() and language_hint().
    void load(std::string_view name, std::span<const std::byte> data);

    const std::filesystem::path& path() const;
    std::size_t size_bytes() const;

    bool is_binary() const;
    /// Decoded UTF-8 text; empty when is_binary().
    const std::string& text() const;
    /// Accepted candidate, nullptr when is_binary() or nothing is loaded.
    const EncodingCandidate* encoding() const;

    /// File-name extension without the dot ("py" for "setup.py"), used by
    /// callers to pick a syntax highlighter. The whole file name when it has
    /// no dot.
    std::string language_hint() const;

    const std::vector<Attempt>& attempts() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace textprobe
