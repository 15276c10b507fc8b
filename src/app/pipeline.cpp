#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_map>
#include <utility>

#include "app/pipeline.hpp"
#include "fec/fountain.hpp"
#include "frame/frame_packer.hpp"
#include "proto/chunk.hpp"
#include "store/raw_file_store.hpp"
#include "util/log.hpp"
#include "util/parallel.hpp"

namespace app
{

namespace fs = std::filesystem;
using framevault::Errc;
using framevault::fail;

// serialized metadata is a few hundred bytes; anything huge is a corrupt length frame
constexpr std::uint32_t MAX_METADATA_BYTES = 16u << 20;

static frame::Geometry geometry_of(const config::Config &cfg)
{
    return frame::Geometry{cfg.width, cfg.height};
}

// ---------------- encoder ----------------

Encoder::Encoder(const config::Config &cfg, aead::Envelope *envelope)
    : cfg_(cfg), envelope_(envelope)
{
}

bool Encoder::encode(const std::vector<std::uint8_t> &payload,
                     const std::string               &filename,
                     store::FrameWriter              &out,
                     framevault::Error               &err,
                     const std::vector<meta::Field>  &extra)
{
    stats_ = EncodeStats{};
    if (!config::validate(cfg_, err))
    {
        LOG_ERROR("invalid configuration: %s", err.detail.c_str());
        return false;
    }
    const frame::Geometry g = geometry_of(cfg_);
    if (out.geometry() != g)
    {
        return fail(err, Errc::BadConfig,
                    "frame store is " + std::to_string(out.geometry().width) + "x" +
                        std::to_string(out.geometry().height) + ", configuration is " +
                        std::to_string(g.width) + "x" + std::to_string(g.height));
    }

    // encryption covers the whole payload, never single chunks
    std::vector<std::uint8_t>        sealed;
    const std::vector<std::uint8_t> *data = &payload;
    if (envelope_)
    {
        if (!envelope_->seal(payload, sealed))
            return fail(err, Errc::Io, "encryption failed");
        data = &sealed;
    }

    meta_ = meta::create(filename, data->size(), cfg_.chunk_size, envelope_ != nullptr);
    char red[32];
    std::snprintf(red, sizeof(red), "%g", cfg_.redundancy);
    meta_.set_extra(META_BLOCK_SIZE, std::to_string(cfg_.block_size));
    meta_.set_extra(META_REDUNDANCY, red);
    for (const auto &f : extra)
    {
        if (f.first == META_BLOCK_SIZE || f.first == META_REDUNDANCY ||
            !meta_.set_extra(f.first, f.second))
            return fail(err, Errc::BadConfig, "invalid metadata field name '" + f.first + "'");
    }
    const std::vector<std::uint8_t> meta_bytes = meta::serialize(meta_);

    const std::vector<chunk::Chunk> chunks = chunk::split(*data, cfg_.chunk_size);
    if (chunks.size() > UINT32_MAX)
        return fail(err, Errc::BadConfig, "payload needs more than 2^32 chunks");

    std::vector<std::vector<std::vector<std::uint8_t>>> packets(chunks.size());
    par::for_each_index(chunks.size(), cfg_.threads, [&](std::size_t i) {
        fountain::Encoder enc(chunks[i], cfg_.block_size, cfg_.redundancy);
        packets[i] = enc.encode();
    });

    // frames go out strictly in order, whatever order the packets were computed in
    for (const auto &f : frame::pack_metadata(g, meta_bytes))
    {
        if (!out.write(f))
            return fail(err, Errc::Io, "cannot write metadata frame to " + out.name());
        stats_.metadata_frames++;
    }

    frame::Frame f;
    for (std::size_t i = 0; i < packets.size(); i++)
    {
        for (const auto &p : packets[i])
        {
            if (!frame::pack_data(g, static_cast<std::uint32_t>(i), p, f))
                return fail(err, Errc::BadConfig, "packet does not fit a frame",
                            static_cast<std::int64_t>(i));
            if (!out.write(f))
                return fail(err, Errc::Io, "cannot write data frame to " + out.name(),
                            static_cast<std::int64_t>(i));
            stats_.data_frames++;
        }
        stats_.packets += packets[i].size();
        packets[i].clear();
        packets[i].shrink_to_fit();
    }

    if (!out.commit())
        return fail(err, Errc::Io, "cannot commit frame store " + out.name());

    stats_.payload_bytes = data->size();
    stats_.chunks        = chunks.size();
    LOG_INFO("encoded %zu bytes%s: %zu chunks, %zu packets, %zu metadata + %zu data frames",
             stats_.payload_bytes, envelope_ ? " (encrypted)" : "", stats_.chunks, stats_.packets,
             stats_.metadata_frames, stats_.data_frames);
    return true;
}

// ---------------- decoder ----------------

Decoder::Decoder(const config::Config &cfg, aead::Envelope *envelope)
    : cfg_(cfg), envelope_(envelope)
{
}

std::size_t Decoder::block_size_for(const meta::Metadata &m) const
{
    const std::string *v = m.find_extra(META_BLOCK_SIZE);
    if (!v)
        return cfg_.block_size;
    char              *end = nullptr;
    errno                  = 0;
    unsigned long long bs  = std::strtoull(v->c_str(), &end, 10);
    if (errno != 0 || end == v->c_str() || *end != '\0' || bs == 0 || bs > UINT16_MAX)
    {
        LOG_WARN("ignoring malformed block_size '%s' in metadata, using %zu", v->c_str(),
                 cfg_.block_size);
        return cfg_.block_size;
    }
    return static_cast<std::size_t>(bs);
}

bool Decoder::read_metadata(store::FrameReader &in, meta::Metadata &out, framevault::Error &err)
{
    frame::Frame f;
    if (!in.next(f))
        return fail(err, Errc::MetadataCorrupt, "missing metadata length frame");

    std::uint32_t len = 0;
    if (!frame::read_metadata_length(f, len))
        return fail(err, Errc::MetadataCorrupt, "metadata length frame too small");
    if (len < 4 || len > MAX_METADATA_BYTES)
        return fail(err, Errc::MetadataCorrupt, "implausible metadata length " + std::to_string(len));

    std::vector<std::uint8_t> raw;
    raw.reserve(len);
    while (raw.size() < len)
    {
        if (!in.next(f))
        {
            return fail(err, Errc::MetadataCorrupt,
                        "metadata truncated after " + std::to_string(raw.size()) + " of " +
                            std::to_string(len) + " bytes");
        }
        if (frame::append_metadata_bytes(f, len - raw.size(), raw) == 0)
            return fail(err, Errc::MetadataCorrupt, "empty metadata frame");
    }

    meta::Metadata m;
    if (!meta::deserialize(raw.data(), raw.size(), m, err))
        return false;
    LOG_DEBUG("metadata: filename=%s file_size=%llu chunks=%llu encrypted=%d", m.filename.c_str(),
              static_cast<unsigned long long>(m.file_size),
              static_cast<unsigned long long>(m.num_chunks), m.encrypted ? 1 : 0);
    out = std::move(m);
    return true;
}

bool Decoder::decode(store::FrameReader &in, std::vector<std::uint8_t> &out, framevault::Error &err)
{
    stats_ = DecodeStats{};

    if (cfg_.threads == 0)
        return fail(err, Errc::BadConfig, "threads must be >= 1");

    if (!read_metadata(in, meta_, err))
        return false;

    // refuse before touching any data frame
    if (meta_.encrypted && !envelope_)
    {
        LOG_ERROR("payload is encrypted but no password was supplied");
        return fail(err, Errc::DecryptionFailed, "payload is encrypted, a password is required");
    }

    // frame geometry comes from the store, block size from the metadata
    const std::size_t block_size = block_size_for(meta_);
    if (block_size == 0 || block_size > UINT16_MAX)
        return fail(err, Errc::BadConfig, "block_size must be in [1, 65535]");
    const std::size_t need = frame::CHUNK_INDEX_SIZE + fountain::MAX_HDR_SIZE + block_size;
    if (in.geometry().bytes() < need)
    {
        return fail(err, Errc::MetadataCorrupt,
                    "frames of " + std::to_string(in.geometry().bytes()) +
                        " bytes cannot carry packets of block_size " + std::to_string(block_size));
    }

    const std::size_t file_size  = static_cast<std::size_t>(meta_.file_size);
    const std::size_t chunk_size = static_cast<std::size_t>(meta_.chunk_size);
    const std::size_t nchunks    = static_cast<std::size_t>(meta_.num_chunks);
    if (nchunks > static_cast<std::size_t>(UINT32_MAX) + 1)
        return fail(err, Errc::MetadataCorrupt, "num_chunks exceeds the 32-bit chunk index");
    if (fountain::block_count(chunk_size + chunk::TAG_SIZE, block_size) > UINT16_MAX)
        return fail(err, Errc::MetadataCorrupt, "chunk_size needs more than 65535 blocks");

    std::unordered_map<std::uint32_t, std::vector<std::vector<std::uint8_t>>> groups;
    frame::Frame                                                              f;
    while (in.next(f))
    {
        stats_.data_frames++;
        auto d = frame::unpack_data(f);
        if (!d)
        {
            stats_.ignored_frames++;
            continue;
        }
        if (d->chunk_index >= nchunks)
        {
            LOG_WARN("ignoring frame for chunk %u (only %zu chunks)", d->chunk_index, nchunks);
            stats_.ignored_frames++;
            continue;
        }
        groups[d->chunk_index].push_back(std::move(d->packet));
    }
    if (in.error())
        return fail(err, Errc::Io, "read error in frame store " + in.name());

    // every chunk needs at least one packet before any decoding starts
    for (std::size_t i = 0; i < nchunks; i++)
    {
        if (groups.find(static_cast<std::uint32_t>(i)) == groups.end())
        {
            LOG_ERROR("no frames for chunk %zu", i);
            return fail(err, Errc::MissingChunk, "no packets for chunk",
                        static_cast<std::int64_t>(i));
        }
    }

    std::vector<chunk::Chunk> decoded(nchunks);
    std::vector<char>         failed(nchunks, 0);
    par::for_each_index(nchunks, cfg_.threads, [&](std::size_t i) {
        const std::size_t len = chunk::tagged_length(file_size, chunk_size, i);
        fountain::Decoder dec(block_size, fountain::block_count(len, block_size));
        for (const auto &p : groups.at(static_cast<std::uint32_t>(i)))
            (void)dec.add_packet(p);  // rejects are logged by the decoder
        auto r = dec.decode();
        if (!r)
        {
            failed[i] = 1;
            return;
        }
        r->resize(len);  // drop the zero padding of the last block
        decoded[i] = std::move(*r);
    });
    for (std::size_t i = 0; i < nchunks; i++)
    {
        if (failed[i])
        {
            LOG_ERROR("chunk %zu: not enough packets to recover all blocks", i);
            return fail(err, Errc::InsufficientPackets, "fountain decode unresolved",
                        static_cast<std::int64_t>(i));
        }
    }

    std::vector<std::uint8_t> payload;
    if (!chunk::reassemble(decoded, payload, err))
        return false;
    decoded.clear();
    if (payload.size() > file_size)
        payload.resize(file_size);

    if (meta_.encrypted)
    {
        std::vector<std::uint8_t> plain;
        if (!envelope_->open(payload, plain))
            return fail(err, Errc::DecryptionFailed, "wrong password or corrupted data");
        payload.swap(plain);
    }

    stats_.chunks = nchunks;
    LOG_INFO("decoded %zu bytes from %zu chunks (%zu data frames, %zu ignored)", payload.size(),
             nchunks, stats_.data_frames, stats_.ignored_frames);
    out.swap(payload);
    return true;
}

// ---------------- file level ----------------

static bool read_whole_file(const std::string         &path,
                            std::vector<std::uint8_t> &out,
                            framevault::Error         &err)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return fail(err, Errc::InputNotFound, "input file not found: " + path);

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return fail(err, Errc::InputNotFound, "cannot open " + path + ": " + std::strerror(errno));
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad())
        return fail(err, Errc::Io, "read error on " + path);
    return true;
}

static bool write_file_atomic(const std::string               &path,
                              const std::vector<std::uint8_t> &data,
                              framevault::Error               &err)
{
    const std::string staging = path + ".part";
    {
        std::ofstream ofs(staging, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return fail(err, Errc::Io, "cannot create " + staging + ": " + std::strerror(errno));
        ofs.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
        {
            std::error_code ec;
            fs::remove(staging, ec);
            return fail(err, Errc::Io, "write error on " + staging);
        }
    }
    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec)
    {
        fs::remove(staging, ec);
        return fail(err, Errc::Io, "cannot rename " + staging + " to " + path);
    }
    return true;
}

bool encode_file(const config::Config &cfg,
                 const std::string    &input,
                 const std::string    &output,
                 aead::Envelope       *envelope,
                 framevault::Error    &err)
{
    if (!config::validate(cfg, err))
        return false;

    std::vector<std::uint8_t> data;
    if (!read_whole_file(input, data, err))
    {
        LOG_ERROR("%s", err.detail.c_str());
        return false;
    }
    LOG_INFO("encoding %s (%zu bytes) into %s", input.c_str(), data.size(), output.c_str());

    auto writer = store::RawFileWriter::create(output, geometry_of(cfg), cfg.fps, err);
    if (!writer)
        return false;

    Encoder enc(cfg, envelope);
    return enc.encode(data, fs::path(input).filename().string(), *writer, err);
}

bool decode_file(const config::Config &cfg,
                 const std::string    &input,
                 const std::string    &output,
                 aead::Envelope       *envelope,
                 framevault::Error    &err,
                 meta::Metadata       *info)
{
    auto reader = store::RawFileReader::open(input, err);
    if (!reader)
        return false;

    Decoder                   dec(cfg, envelope);
    std::vector<std::uint8_t> data;
    if (!dec.decode(*reader, data, err))
        return false;
    if (!write_file_atomic(output, data, err))
    {
        LOG_ERROR("%s", err.detail.c_str());
        return false;
    }
    if (info)
        *info = dec.metadata();
    LOG_INFO("wrote %zu bytes to %s", data.size(), output.c_str());
    return true;
}

bool read_info(const std::string &input, meta::Metadata &out, framevault::Error &err)
{
    auto reader = store::RawFileReader::open(input, err);
    if (!reader)
        return false;
    Decoder dec(config::Config{});
    return dec.read_metadata(*reader, out, err);
}

}  // namespace app
