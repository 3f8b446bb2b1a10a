#include <textprobe/file_view.h>

#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#  include <fstream>
#else
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace textprobe {

namespace {

// Contents of a regular file for the duration of one decode. Mapped
// read-only on POSIX, read into memory elsewhere. Error messages name the
// reason only; callers add the path.
class FileBytes {
public:
    explicit FileBytes(const std::filesystem::path& path);
    ~FileBytes();

    FileBytes(const FileBytes&) = delete;
    FileBytes& operator=(const FileBytes&) = delete;

    std::span<const std::byte> span() const;

private:
#ifdef _WIN32
    std::vector<std::byte> buffer_;
#else
    void* map_ = nullptr;
    std::size_t size_ = 0;
#endif
};

#ifdef _WIN32

FileBytes::FileBytes(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw std::runtime_error(ec ? ec.message() : "not a regular file");

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("cannot open for reading");

    auto size = static_cast<std::size_t>(in.tellg());
    buffer_.resize(size);
    in.seekg(0);
    if (size && !in.read(reinterpret_cast<char*>(buffer_.data()),
                         static_cast<std::streamsize>(size)))
        throw std::runtime_error("read failed");
}

FileBytes::~FileBytes() = default;

std::span<const std::byte> FileBytes::span() const {
    return buffer_;
}

#else

FileBytes::FileBytes(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) throw std::runtime_error(std::strerror(errno));

    struct stat st;
    if (::fstat(fd, &st) < 0) {
        int saved = errno;
        ::close(fd);
        throw std::runtime_error(std::strerror(saved));
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        throw std::runtime_error("not a regular file");
    }
    if constexpr (sizeof(std::size_t) < sizeof(st.st_size)) {
        if (st.st_size > static_cast<decltype(st.st_size)>(
                             std::numeric_limits<std::size_t>::max())) {
            ::close(fd);
            throw std::runtime_error("file too large for the address space");
        }
    }

    size_ = static_cast<std::size_t>(st.st_size);
    if (size_ > 0) {
        void* mapped = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        int saved = errno;
        ::close(fd);
        if (mapped == MAP_FAILED) throw std::runtime_error(std::strerror(saved));
        map_ = mapped;
    } else {
        ::close(fd);
    }
}

FileBytes::~FileBytes() {
    if (map_) ::munmap(map_, size_);
}

std::span<const std::byte> FileBytes::span() const {
    return {static_cast<const std::byte*>(map_), size_};
}

#endif

} // namespace

struct FileView::Impl {
    FileViewConfig config;
    std::filesystem::path path;
    std::size_t size_bytes = 0;
    bool loaded = false;
    DecodeResult result;
    std::vector<Attempt> attempts;
    std::string empty;

    Registry registry() const {
        if (config.order.empty()) return default_registry();
        return config.order;
    }

    void decode(std::span<const std::byte> data) {
        std::vector<Attempt> trace;
        result = decode_with_fallback(data, registry(), config.trace ? &trace : nullptr);
        attempts = std::move(trace);
        size_bytes = data.size();
        loaded = true;
    }
};

FileView::FileView(const FileViewConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

FileView::~FileView() = default;
FileView::FileView(FileView&&) noexcept = default;
FileView& FileView::operator=(FileView&&) noexcept = default;

void FileView::open_file(const std::filesystem::path& path) {
    FileBytes bytes(path);
    impl_->path = path;
    impl_->decode(bytes.span());
}

void FileView::load(std::string_view name, std::span<const std::byte> data) {
    impl_->path = std::filesystem::path(name);
    impl_->decode(data);
}

const std::filesystem::path& FileView::path() const {
    return impl_->path;
}

std::size_t FileView::size_bytes() const {
    return impl_->size_bytes;
}

bool FileView::is_binary() const {
    return impl_->loaded && impl_->result.is_binary();
}

const std::string& FileView::text() const {
    return impl_->result.text ? *impl_->result.text : impl_->empty;
}

const EncodingCandidate* FileView::encoding() const {
    return impl_->result.encoding;
}

std::string FileView::language_hint() const {
    std::string name = impl_->path.filename().string();
    auto dot = name.rfind('.');
    if (dot == std::string::npos) return name;
    return name.substr(dot + 1);
}

const std::vector<Attempt>& FileView::attempts() const {
    return impl_->attempts;
}

} // namespace textprobe
