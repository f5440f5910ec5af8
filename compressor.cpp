#include "compressor.hpp"
#include "errors.hpp"
#include <zlib.h>
#include <zstd.h>
#include <algorithm>
#include <string>

namespace {

// windowBits 15 plus 16 selects the gzip wrapper in zlib.
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int GZIP_MEM_LEVEL = 8;

Bytes gzip_compress(const Bytes& input, int level)
{
    z_stream strm = {};
    if (deflateInit2(&strm, level, Z_DEFLATED, GZIP_WINDOW_BITS, GZIP_MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK)
    {
        throw std::runtime_error("zlib deflateInit2 failed");
    }
    Bytes compressed_data(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = const_cast<Bytef *>(input.data());
    strm.avail_out = static_cast<uInt>(compressed_data.size());
    strm.next_out = compressed_data.data();

    if (deflate(&strm, Z_FINISH) != Z_STREAM_END)
    {
        deflateEnd(&strm);
        throw std::runtime_error("zlib deflate failed");
    }
    compressed_data.resize(strm.total_out);
    deflateEnd(&strm);
    return compressed_data;
}

Bytes gzip_decompress(const Bytes& input, std::optional<size_t> expected_size)
{
    z_stream strm = {};
    if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK)
    {
        throw std::runtime_error("zlib inflateInit2 failed");
    }

    Bytes decompressed_data;

    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_in = const_cast<Bytef *>(input.data());

    Bytes out_buffer(64 * 1024);
    int ret = Z_OK;
    do
    {
        strm.avail_out = static_cast<uInt>(out_buffer.size());
        strm.next_out = out_buffer.data();
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR)
        {
            std::string msg = strm.msg ? strm.msg : "error code " + std::to_string(ret);
            inflateEnd(&strm);
            throw CorruptData("gzip stream is invalid: " + msg);
        }
        size_t have = out_buffer.size() - strm.avail_out;
        decompressed_data.insert(decompressed_data.end(), out_buffer.begin(), out_buffer.begin() + have);
        if (expected_size && decompressed_data.size() > *expected_size)
        {
            inflateEnd(&strm);
            throw CorruptData("gzip stream decodes to more than " + std::to_string(*expected_size) + " bytes");
        }
        // Z_BUF_ERROR with no input left means the stream was cut short.
        if (ret == Z_BUF_ERROR && strm.avail_in == 0)
        {
            break;
        }
    } while (ret != Z_STREAM_END);

    bool trailing = strm.avail_in != 0;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END)
    {
        throw CorruptData("gzip stream is truncated");
    }
    if (trailing)
    {
        throw CorruptData("unexpected data after end of gzip stream");
    }
    return decompressed_data;
}

Bytes zstd_compress(const Bytes& input, int level)
{
    size_t bound = ZSTD_compressBound(input.size());
    Bytes compressed_data(bound);
    size_t compressed_size = ZSTD_compress(compressed_data.data(), bound, input.data(), input.size(), level);
    if (ZSTD_isError(compressed_size))
    {
        throw std::runtime_error("zstd compression failed: " + std::string(ZSTD_getErrorName(compressed_size)));
    }
    compressed_data.resize(compressed_size);
    return compressed_data;
}

Bytes zstd_decompress(const Bytes& input, std::optional<size_t> expected_size)
{
    ZSTD_DStream* dstream = ZSTD_createDStream();
    if (dstream == nullptr) throw std::runtime_error("ZSTD_createDStream() failed");

    Bytes decompressed_data;

    ZSTD_inBuffer in_buf = { input.data(), input.size(), 0 };
    Bytes out_buffer(ZSTD_DStreamOutSize());
    size_t ret = 1;

    while (in_buf.pos < in_buf.size)
    {
        ZSTD_outBuffer out_buf = { out_buffer.data(), out_buffer.size(), 0 };
        ret = ZSTD_decompressStream(dstream, &out_buf, &in_buf);
        if (ZSTD_isError(ret))
        {
            ZSTD_freeDStream(dstream);
            throw CorruptData("zstd stream is invalid: " + std::string(ZSTD_getErrorName(ret)));
        }
        decompressed_data.insert(decompressed_data.end(), out_buffer.begin(), out_buffer.begin() + out_buf.pos);
        if (expected_size && decompressed_data.size() > *expected_size)
        {
            ZSTD_freeDStream(dstream);
            throw CorruptData("zstd stream decodes to more than " + std::to_string(*expected_size) + " bytes");
        }
        if (ret == 0 && in_buf.pos < in_buf.size)
        {
            ZSTD_freeDStream(dstream);
            throw CorruptData("unexpected data after end of zstd frame");
        }
    }

    // Drain output still buffered inside the decoder.
    while (ret != 0)
    {
        ZSTD_outBuffer out_buf = { out_buffer.data(), out_buffer.size(), 0 };
        ret = ZSTD_decompressStream(dstream, &out_buf, &in_buf);
        if (ZSTD_isError(ret))
        {
            ZSTD_freeDStream(dstream);
            throw CorruptData("zstd stream is invalid: " + std::string(ZSTD_getErrorName(ret)));
        }
        if (out_buf.pos == 0)
        {
            break;
        }
        decompressed_data.insert(decompressed_data.end(), out_buffer.begin(), out_buffer.begin() + out_buf.pos);
        if (expected_size && decompressed_data.size() > *expected_size)
        {
            ZSTD_freeDStream(dstream);
            throw CorruptData("zstd stream decodes to more than " + std::to_string(*expected_size) + " bytes");
        }
    }
    ZSTD_freeDStream(dstream);

    if (ret != 0)
    {
        throw CorruptData("zstd frame is truncated");
    }
    return decompressed_data;
}

} // namespace

Bytes compress_data(const Bytes& input, int level, Codec codec)
{
    if (level < MIN_LEVEL || level > MAX_LEVEL)
    {
        throw InvalidParameters("Compression level must be between 1 and 9, got " + std::to_string(level));
    }
    if (codec == Codec::Zstd) return zstd_compress(input, level);
    return gzip_compress(input, level);
}

Bytes decompress_data(const Bytes& input, Codec codec, std::optional<size_t> expected_size)
{
    if (codec == Codec::Zstd) return zstd_decompress(input, expected_size);
    return gzip_decompress(input, expected_size);
}
