#include "gelf_logger/compressor.hpp"
#include "gelf_logger/errors.hpp"

#include <zlib.h>

#include <fmt/format.h>

#include <vector>

namespace gelf_logger
{

namespace
{

constexpr int kZlibWindowBits = 15;
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kBufferSize = 16 * 1024;

int window_bits(Compression mode)
{
  return mode == Compression::Gzip ? kGzipWindowBits : kZlibWindowBits;
}

}  // namespace

std::string compress(std::string_view data, Compression mode)
{
  if (mode == Compression::None)
  {
    return std::string(data);
  }

  z_stream strm{};
  strm.zalloc = Z_NULL;
  strm.zfree = Z_NULL;
  strm.opaque = Z_NULL;
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits(mode), 8,
                   Z_DEFAULT_STRATEGY) != Z_OK)
  {
    throw CompressionError("failed to initialize compression");
  }

  std::string out;
  std::vector<unsigned char> buffer(kBufferSize);
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());

  int ret;
  do
  {
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());
    ret = deflate(&strm, Z_FINISH);
    if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR)
    {
      deflateEnd(&strm);
      throw CompressionError(fmt::format("deflate failed: {}", ret));
    }
    out.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - strm.avail_out);
  } while (ret != Z_STREAM_END);

  deflateEnd(&strm);
  return out;
}

std::string decompress(std::string_view data, Compression mode)
{
  if (mode == Compression::None)
  {
    return std::string(data);
  }

  z_stream strm{};
  strm.zalloc = Z_NULL;
  strm.zfree = Z_NULL;
  strm.opaque = Z_NULL;
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());
  if (inflateInit2(&strm, window_bits(mode)) != Z_OK)
  {
    throw CompressionError("failed to initialize decompression");
  }

  std::string out;
  std::vector<unsigned char> buffer(kBufferSize);
  int ret;
  do
  {
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
        (ret == Z_BUF_ERROR && strm.avail_in == 0))
    {
      inflateEnd(&strm);
      throw CompressionError(fmt::format("inflate failed: {}", ret));
    }
    out.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - strm.avail_out);
  } while (ret != Z_STREAM_END);

  inflateEnd(&strm);
  return out;
}

}  // namespace gelf_logger
