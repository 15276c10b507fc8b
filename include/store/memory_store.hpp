#pragma once
#include <cstddef>
#include <vector>

#include "store/iframe_store.hpp"

namespace store
{

// In-memory store: written frames can be read back, dropped, reordered or corrupted in place.
class MemoryFrameStore final : public FrameWriter, public FrameReader
{
  public:
    explicit MemoryFrameStore(Geometry g) : geometry_(g) {}

    bool        write(const Frame &f) override;
    bool        commit() override;
    bool        next(Frame &out) override;
    bool        error() const override { return false; }
    Geometry    geometry() const override { return geometry_; }
    std::string name() const override { return "memory"; }

    bool                committed() const { return committed_; }
    void                rewind() { cursor_ = 0; }
    std::vector<Frame> &frames() { return frames_; }

  private:
    Geometry           geometry_;
    std::vector<Frame> frames_;
    std::size_t        cursor_{0};
    bool               committed_{false};
};

}  // namespace store
