#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "store/iframe_store.hpp"
#include "util/error.hpp"

/*
.fvr raw frame container:
  [magic "FVR1"][width u32 LE][height u32 LE][fps u32 LE]  (16 bytes)
  [frame 0: width*height*3 bytes][frame 1] ...
*/

namespace store
{

inline constexpr char        RAW_MAGIC[4]    = {'F', 'V', 'R', '1'};
inline constexpr std::size_t RAW_HEADER_SIZE = 16;

// Writes into "<path>.part" and renames onto <path> on commit(). An uncommitted staging file is
// removed on destruction, so a failed encode leaves nothing behind.
class RawFileWriter final : public FrameWriter
{
    // only create() can name this
    struct Private
    {
        explicit Private() = default;
    };

  public:
    static std::unique_ptr<RawFileWriter> create(const std::string &path,
                                                 Geometry           g,
                                                 std::uint32_t      fps,
                                                 framevault::Error &err);
    RawFileWriter(Private, std::string path, Geometry g, int fd);
    ~RawFileWriter() override;

    RawFileWriter(const RawFileWriter &)            = delete;
    RawFileWriter &operator=(const RawFileWriter &) = delete;

    bool        write(const Frame &f) override;
    bool        commit() override;
    Geometry    geometry() const override { return geometry_; }
    std::string name() const override { return path_; }

    std::size_t frames_written() const { return written_; }

  private:
    std::string path_;
    std::string staging_;
    Geometry    geometry_;
    int         fd_{-1};
    std::size_t written_{0};
    bool        committed_{false};
};

class RawFileReader final : public FrameReader
{
    // only open() can name this
    struct Private
    {
        explicit Private() = default;
    };

  public:
    // InputNotFound when the path cannot be opened, UnsupportedContainer for a bad header.
    static std::unique_ptr<RawFileReader> open(const std::string &path, framevault::Error &err);
    RawFileReader(Private, std::string path, int fd);
    ~RawFileReader() override;

    RawFileReader(const RawFileReader &)            = delete;
    RawFileReader &operator=(const RawFileReader &) = delete;

    bool        next(Frame &out) override;
    bool        error() const override { return error_; }
    Geometry    geometry() const override { return geometry_; }
    std::string name() const override { return path_; }

    std::uint32_t fps() const { return fps_; }
    std::size_t   frame_count() const { return total_; }

  private:
    std::string   path_;
    int           fd_{-1};
    Geometry      geometry_{};
    std::uint32_t fps_{0};
    std::size_t   total_{0};
    std::size_t   read_{0};
    bool          error_{false};
};

}  // namespace store
