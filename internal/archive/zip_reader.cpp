#include "zip_reader.hpp"

#include <zlib.h>

#include "internal/archive/zip_format.hpp"
#include "internal/archive/zip_writer.hpp"

namespace roipack::archive {

using util::ErrorCode;
using util::Status;

namespace {

Status Corrupt(std::string message) {
  return Status::Err(ErrorCode::Corruption, std::move(message));
}

// End of central directory record; a trailing comment may follow it.
util::Result<std::size_t> FindEndOfCentral(std::string_view archive) {
  if (archive.size() < format::kEndOfCentralSize) {
    return Corrupt("archive too small for an end of central directory record");
  }

  std::size_t pos = archive.size() - format::kEndOfCentralSize;
  while (true) {
    if (format::GetU32(archive, pos) == format::kEndOfCentralSignature) {
      return pos;
    }
    if (pos == 0 || archive.size() - pos > format::kEndOfCentralSize + 0xFFFF) {
      break;
    }
    --pos;
  }
  return Corrupt("end of central directory record not found");
}

} // namespace

util::Result<std::string> Inflate(std::string_view input, std::size_t expected_size) {
  z_stream stream{};
  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    return Status::Err(ErrorCode::CompressionError, "inflateInit2 failed");
  }

  // One spare byte so an empty stream still has somewhere to land.
  std::string out(expected_size + 1, '\0');

  stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in  = static_cast<uInt>(input.size());
  stream.next_out  = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int  rc       = inflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  inflateEnd(&stream);

  if (rc != Z_STREAM_END) {
    return Corrupt("inflate failed (zlib error " + std::to_string(rc) + ")");
  }
  if (produced != expected_size) {
    return Corrupt("inflated size " + std::to_string(produced) + " does not match recorded size " + std::to_string(expected_size));
  }
  out.resize(expected_size);
  return out;
}

util::Result<std::vector<ArchiveEntry>> ReadZip(std::string_view archive) {
  std::size_t eocd = 0;
  ROIPACK_ASSIGN_OR_RETURN(eocd, FindEndOfCentral(archive));

  const std::size_t entries        = format::GetU16(archive, eocd + 10);
  const std::size_t central_size   = format::GetU32(archive, eocd + 12);
  const std::size_t central_offset = format::GetU32(archive, eocd + 16);

  if (central_offset + central_size > eocd) {
    return Corrupt("central directory overlaps end record");
  }

  std::vector<ArchiveEntry> out;
  out.reserve(entries);

  std::size_t pos = central_offset;
  for (std::size_t i = 0; i < entries; ++i) {
    if (pos + format::kCentralHeaderSize > eocd || format::GetU32(archive, pos) != format::kCentralHeaderSignature) {
      return Corrupt("bad central directory header at entry " + std::to_string(i));
    }

    const auto flags             = format::GetU16(archive, pos + 8);
    const auto method            = format::GetU16(archive, pos + 10);
    const auto crc               = format::GetU32(archive, pos + 16);
    const auto compressed_size   = format::GetU32(archive, pos + 20);
    const auto uncompressed_size = format::GetU32(archive, pos + 24);
    const auto name_len          = format::GetU16(archive, pos + 28);
    const auto extra_len         = format::GetU16(archive, pos + 30);
    const auto comment_len       = format::GetU16(archive, pos + 32);
    const auto local_offset      = format::GetU32(archive, pos + 42);

    if (pos + format::kCentralHeaderSize + name_len > eocd) {
      return Corrupt("truncated central directory name at entry " + std::to_string(i));
    }
    if (flags & 0x0001) {
      return Corrupt("encrypted entries are not supported");
    }

    ArchiveEntry entry;
    entry.path   = std::string(archive.substr(pos + format::kCentralHeaderSize, name_len));
    entry.crc32  = crc;
    entry.method = method;

    pos += format::kCentralHeaderSize + name_len + extra_len + comment_len;

    // Local header: data starts after its own name and extra field.
    if (local_offset + format::kLocalHeaderSize > archive.size() ||
        format::GetU32(archive, local_offset) != format::kLocalHeaderSignature) {
      return Corrupt(entry.path + ": bad local header");
    }
    const auto local_name_len  = format::GetU16(archive, local_offset + 26);
    const auto local_extra_len = format::GetU16(archive, local_offset + 28);
    const auto data_offset     = static_cast<std::size_t>(local_offset) + format::kLocalHeaderSize + local_name_len + local_extra_len;

    if (data_offset + compressed_size > archive.size()) {
      return Corrupt(entry.path + ": entry data runs past end of archive");
    }
    const auto data = archive.substr(data_offset, compressed_size);

    if (method == format::kMethodStored) {
      if (compressed_size != uncompressed_size) {
        return Corrupt(entry.path + ": stored entry size mismatch");
      }
      entry.content = std::string(data);
    } else if (method == format::kMethodDeflated) {
      ROIPACK_ASSIGN_OR_RETURN(entry.content, Inflate(data, uncompressed_size));
    } else {
      return Corrupt(entry.path + ": unsupported compression method " + std::to_string(method));
    }

    if (Crc32(entry.content) != crc) {
      return Corrupt(entry.path + ": CRC mismatch");
    }

    out.push_back(std::move(entry));
  }

  return out;
}

} // namespace roipack::archive
