#include <algorithm>
#include <zlib.h>

#include "codec/compression.hpp"
#include "util/log.hpp"

namespace compression
{

namespace
{
constexpr std::size_t INFLATE_CHUNK = 16 * 1024;
}  // namespace

std::size_t max_inflated_size(std::size_t compressed_size)
{
    return compressed_size * MAX_DEFLATE_RATIO;
}

std::optional<Bytes> compress(const Bytes &in)
{
    if (in.empty())
        return std::nullopt;

    uLongf out_len = compressBound(static_cast<uLong>(in.size()));
    Bytes  out(out_len);
    int    rc = compress2(out.data(), &out_len, in.data(), static_cast<uLong>(in.size()),
                          Z_BEST_COMPRESSION);
    if (rc != Z_OK)
    {
        LOG_ERROR("compress: deflate failed (rc=%d)", rc);
        return std::nullopt;
    }
    if (out_len >= in.size())
    {
        LOG_DEBUG("compress: no net savings (%zu -> %lu bytes)", in.size(),
                  static_cast<unsigned long>(out_len));
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

std::optional<Bytes> decompress(const Bytes &in, std::uint32_t original_size)
{
    if (original_size == 0)
    {
        LOG_DEBUG("decompress: original size is 0, payload is not compressed");
        return in;
    }
    if (original_size > max_inflated_size(in.size()))
    {
        LOG_ERROR("decompress: %zu bytes cannot inflate to %u", in.size(), original_size);
        return std::nullopt;
    }

    z_stream zs{};
    zs.next_in  = const_cast<Bytef *>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    int rc      = inflateInit(&zs);
    if (rc != Z_OK)
    {
        LOG_ERROR("decompress: inflateInit failed (rc=%d)", rc);
        return std::nullopt;
    }

    // Grow the output as data inflates; never past original_size + 1 so an
    // oversized stream is detected without inflating all of it.
    Bytes out;
    while (rc == Z_OK)
    {
        const std::size_t have = out.size();
        const std::size_t room =
            std::min<std::size_t>(INFLATE_CHUNK, std::size_t{original_size} + 1 - have);
        if (room == 0)
            break;
        out.resize(have + room);
        zs.next_out  = out.data() + have;
        zs.avail_out = static_cast<uInt>(room);
        rc           = inflate(&zs, Z_NO_FLUSH);
        out.resize(have + room - zs.avail_out);
    }
    inflateEnd(&zs);

    if (rc != Z_STREAM_END)
    {
        LOG_ERROR("decompress: inflate failed (rc=%d, in=%zu, expect=%u)", rc, in.size(),
                  original_size);
        return std::nullopt;
    }
    if (out.size() != original_size)
    {
        LOG_ERROR("decompress: got %zu bytes, expect %u", out.size(), original_size);
        return std::nullopt;
    }
    LOG_DEBUG("decompress: %zu -> %u bytes", in.size(), original_size);
    return out;
}

}  // namespace compression
