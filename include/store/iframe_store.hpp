#pragma once
#include <string>

#include "frame/frame_packer.hpp"

namespace store
{

using frame::Frame;
using frame::Geometry;

// Append-only sink of fixed-size frames. Nothing is visible to readers before commit().
struct FrameWriter
{
    virtual bool        write(const Frame &f)  = 0;
    virtual bool        commit()               = 0;
    virtual Geometry    geometry() const       = 0;
    virtual std::string name() const { return ""; }
    virtual ~FrameWriter() = default;
};

// Forward-only source of frames. next() returns false at the end or on error.
struct FrameReader
{
    virtual bool        next(Frame &out)   = 0;
    virtual bool        error() const      = 0;
    virtual Geometry    geometry() const   = 0;
    virtual std::string name() const { return ""; }
    virtual ~FrameReader() = default;
};

}  // namespace store
