#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

#include "store/raw_file_store.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace store
{

using framevault::Errc;
using framevault::fail;

static bool write_full(int fd, const std::uint8_t *data, std::size_t len)
{
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t n = ::write(fd, data + done, len - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

// Returns bytes read; short only at end of file or on error (errno set).
static std::size_t read_full(int fd, std::uint8_t *data, std::size_t len)
{
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t n = ::read(fd, data + done, len - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return done;
        }
        if (n == 0)
            return done;
        done += static_cast<std::size_t>(n);
    }
    return done;
}

// ---------------- writer ----------------

RawFileWriter::RawFileWriter(Private, std::string path, Geometry g, int fd)
    : path_(std::move(path)), staging_(path_ + ".part"), geometry_(g), fd_(fd)
{
}

std::unique_ptr<RawFileWriter> RawFileWriter::create(const std::string &path,
                                                     Geometry           g,
                                                     std::uint32_t      fps,
                                                     framevault::Error &err)
{
    if (path.empty() || g.pixels() == 0)
    {
        fail(err, Errc::Io, "invalid output path or geometry");
        return nullptr;
    }
    const std::string staging = path + ".part";
    int fd = ::open(staging.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        LOG_ERROR("open(%s) failed: %s", staging.c_str(), std::strerror(errno));
        fail(err, Errc::Io, "cannot create " + staging + ": " + std::strerror(errno));
        return nullptr;
    }

    auto w = std::make_unique<RawFileWriter>(Private{}, path, g, fd);

    std::uint8_t hdr[RAW_HEADER_SIZE];
    std::memcpy(hdr, RAW_MAGIC, sizeof(RAW_MAGIC));
    bytes::put_u32le(hdr + 4, g.width);
    bytes::put_u32le(hdr + 8, g.height);
    bytes::put_u32le(hdr + 12, fps);
    if (!write_full(fd, hdr, sizeof(hdr)))
    {
        LOG_ERROR("write header to %s failed: %s", staging.c_str(), std::strerror(errno));
        fail(err, Errc::Io, "cannot write container header");
        return nullptr;  // destructor removes the staging file
    }
    return w;
}

RawFileWriter::~RawFileWriter()
{
    if (fd_ >= 0)
        ::close(fd_);
    if (!committed_)
        (void)::unlink(staging_.c_str());  // may not exist
}

bool RawFileWriter::write(const Frame &f)
{
    if (fd_ < 0 || committed_)
        return false;
    if (f.size() != geometry_.bytes())
    {
        LOG_ERROR("write: frame of %zu bytes, container expects %zu", f.size(), geometry_.bytes());
        return false;
    }
    if (!write_full(fd_, f.data(), f.size()))
    {
        LOG_ERROR("write(%s) failed: %s", staging_.c_str(), std::strerror(errno));
        return false;
    }
    written_++;
    return true;
}

bool RawFileWriter::commit()
{
    if (fd_ < 0 || committed_)
        return false;
    if (::fsync(fd_) != 0)
        LOG_WARN("fsync(%s) failed: %s", staging_.c_str(), std::strerror(errno));
    if (::close(fd_) != 0)
    {
        fd_ = -1;
        LOG_ERROR("close(%s) failed: %s", staging_.c_str(), std::strerror(errno));
        return false;
    }
    fd_ = -1;
    if (std::rename(staging_.c_str(), path_.c_str()) != 0)
    {
        LOG_ERROR("rename(%s -> %s) failed: %s", staging_.c_str(), path_.c_str(),
                  std::strerror(errno));
        return false;
    }
    committed_ = true;
    LOG_DEBUG("committed %zu frames to %s", written_, path_.c_str());
    return true;
}

// ---------------- reader ----------------

std::unique_ptr<RawFileReader> RawFileReader::open(const std::string &path, framevault::Error &err)
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        fail(err, Errc::InputNotFound, path + ": " + std::strerror(errno));
        return nullptr;
    }
    auto r = std::make_unique<RawFileReader>(Private{}, path, fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode))
    {
        fail(err, Errc::UnsupportedContainer, path + ": not a regular file");
        return nullptr;
    }

    std::uint8_t hdr[RAW_HEADER_SIZE];
    if (read_full(fd, hdr, sizeof(hdr)) != sizeof(hdr) ||
        std::memcmp(hdr, RAW_MAGIC, sizeof(RAW_MAGIC)) != 0)
    {
        LOG_ERROR("%s: not a frame container (bad or short header)", path.c_str());
        fail(err, Errc::UnsupportedContainer, path + ": bad container header");
        return nullptr;
    }
    r->geometry_.width  = bytes::get_u32le(hdr + 4);
    r->geometry_.height = bytes::get_u32le(hdr + 8);
    r->fps_             = bytes::get_u32le(hdr + 12);
    if (r->geometry_.pixels() == 0)
    {
        fail(err, Errc::UnsupportedContainer, path + ": zero frame geometry");
        return nullptr;
    }

    const std::size_t body  = static_cast<std::size_t>(st.st_size) - RAW_HEADER_SIZE;
    const std::size_t fsize = r->geometry_.bytes();
    r->total_               = body / fsize;
    if (body % fsize != 0)
        LOG_WARN("%s: ignoring trailing partial frame (%zu bytes)", path.c_str(), body % fsize);

    LOG_DEBUG("opened %s: %ux%u @%u fps, %zu frames", path.c_str(), r->geometry_.width,
              r->geometry_.height, r->fps_, r->total_);
    return r;
}

RawFileReader::RawFileReader(Private, std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

RawFileReader::~RawFileReader()
{
    if (fd_ >= 0)
        ::close(fd_);
}

bool RawFileReader::next(Frame &out)
{
    if (error_ || read_ >= total_)
        return false;
    out.resize(geometry_.bytes());
    if (read_full(fd_, out.data(), out.size()) != out.size())
    {
        LOG_ERROR("read(%s) failed at frame %zu: %s", path_.c_str(), read_, std::strerror(errno));
        error_ = true;
        return false;
    }
    read_++;
    return true;
}

}  // namespace store
