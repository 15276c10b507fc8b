#include "store/memory_store.hpp"
#include "util/log.hpp"

namespace store
{

bool MemoryFrameStore::write(const Frame &f)
{
    if (f.size() != geometry_.bytes())
    {
        LOG_ERROR("write: frame of %zu bytes, store expects %zu", f.size(), geometry_.bytes());
        return false;
    }
    frames_.push_back(f);
    return true;
}

bool MemoryFrameStore::commit()
{
    committed_ = true;
    return true;
}

bool MemoryFrameStore::next(Frame &out)
{
    if (cursor_ >= frames_.size())
        return false;
    out = frames_[cursor_++];
    return true;
}

}  // namespace store
