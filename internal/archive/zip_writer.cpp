#include "zip_writer.hpp"

#include <zlib.h>

#include <ctime>
#include <limits>

#include "internal/archive/zip_format.hpp"

namespace roipack::archive {

using util::ErrorCode;
using util::Status;

namespace {

constexpr std::uint64_t kMaxZip32   = std::numeric_limits<std::uint32_t>::max();
constexpr std::size_t   kMaxEntries = std::numeric_limits<std::uint16_t>::max();

void ToDosDateTime(util::TimePoint tp, std::uint16_t* dos_time, std::uint16_t* dos_date) {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  const auto t       = static_cast<std::time_t>(seconds);

  std::tm tm{};
  gmtime_r(&t, &tm);

  const int year = tm.tm_year + 1900;
  if (year < 1980) {
    // DOS epoch
    *dos_time = 0;
    *dos_date = static_cast<std::uint16_t>((1 << 5) | 1);
    return;
  }

  *dos_time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  *dos_date = static_cast<std::uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

} // namespace

std::uint32_t Crc32(std::string_view data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc       = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
  return static_cast<std::uint32_t>(crc);
}

util::Result<std::string> Deflate(std::string_view input, int level) {
  if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
    return Status::Err(ErrorCode::InvalidArgument, "compression level must be within 0..9, got " + std::to_string(level));
  }
  if (input.size() > kMaxZip32) {
    return Status::Err(ErrorCode::InvalidArgument, "entry exceeds 4 GiB without ZIP64 support");
  }

  z_stream stream{};
  // Negative window bits: raw deflate, no zlib header, as ZIP method 8 expects.
  if (deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return Status::Err(ErrorCode::CompressionError, "deflateInit2 failed");
  }

  std::string out;
  out.resize(deflateBound(&stream, static_cast<uLong>(input.size())));

  stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in  = static_cast<uInt>(input.size());
  stream.next_out  = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  deflateEnd(&stream);

  if (rc != Z_STREAM_END) {
    return Status::Err(ErrorCode::CompressionError, "deflate did not finish (zlib error " + std::to_string(rc) + ")");
  }

  out.resize(produced);
  return out;
}

ZipWriter::ZipWriter(ZipOptions options) : options_(options) {
  ToDosDateTime(options_.modified_at, &dos_time_, &dos_date_);
}

util::Status ZipWriter::AddFile(const std::string& path, std::string_view content) {
  if (finished_) {
    return Status::Err(ErrorCode::InvalidArgument, "archive already finished");
  }
  if (path.empty() || path.size() > std::numeric_limits<std::uint16_t>::max()) {
    return Status::Err(ErrorCode::InvalidArgument, "invalid entry path length");
  }
  if (central_.size() >= kMaxEntries) {
    return Status::Err(ErrorCode::InvalidArgument, "too many entries without ZIP64 support");
  }

  auto compressed = Deflate(content, options_.compression_level);
  if (!compressed.ok()) {
    return Status::Err(compressed.status().code, path + ": " + compressed.status().message);
  }

  if (buffer_.size() + format::kLocalHeaderSize + path.size() + compressed->size() > kMaxZip32) {
    return Status::Err(ErrorCode::InvalidArgument, "archive exceeds 4 GiB without ZIP64 support");
  }

  CentralRecord record;
  record.path              = path;
  record.crc32             = Crc32(content);
  record.compressed_size   = static_cast<std::uint32_t>(compressed->size());
  record.uncompressed_size = static_cast<std::uint32_t>(content.size());
  record.local_offset      = static_cast<std::uint32_t>(buffer_.size());

  format::PutU32(buffer_, format::kLocalHeaderSignature);
  format::PutU16(buffer_, format::kVersionNeeded);
  format::PutU16(buffer_, 0); // flags
  format::PutU16(buffer_, format::kMethodDeflated);
  format::PutU16(buffer_, dos_time_);
  format::PutU16(buffer_, dos_date_);
  format::PutU32(buffer_, record.crc32);
  format::PutU32(buffer_, record.compressed_size);
  format::PutU32(buffer_, record.uncompressed_size);
  format::PutU16(buffer_, static_cast<std::uint16_t>(path.size()));
  format::PutU16(buffer_, 0); // extra length
  buffer_ += path;
  buffer_ += *compressed;

  central_.push_back(std::move(record));
  return Status::Ok();
}

util::Result<std::string> ZipWriter::Finish() {
  if (finished_) {
    return Status::Err(ErrorCode::InvalidArgument, "archive already finished");
  }
  finished_ = true;

  const auto central_offset = buffer_.size();
  for (const auto& record : central_) {
    format::PutU32(buffer_, format::kCentralHeaderSignature);
    format::PutU16(buffer_, format::kVersionNeeded); // made by: MS-DOS, 2.0
    format::PutU16(buffer_, format::kVersionNeeded);
    format::PutU16(buffer_, 0); // flags
    format::PutU16(buffer_, format::kMethodDeflated);
    format::PutU16(buffer_, dos_time_);
    format::PutU16(buffer_, dos_date_);
    format::PutU32(buffer_, record.crc32);
    format::PutU32(buffer_, record.compressed_size);
    format::PutU32(buffer_, record.uncompressed_size);
    format::PutU16(buffer_, static_cast<std::uint16_t>(record.path.size()));
    format::PutU16(buffer_, 0); // extra length
    format::PutU16(buffer_, 0); // comment length
    format::PutU16(buffer_, 0); // disk number
    format::PutU16(buffer_, 0); // internal attributes
    format::PutU32(buffer_, 0); // external attributes
    format::PutU32(buffer_, record.local_offset);
    buffer_ += record.path;
  }
  const auto central_size = buffer_.size() - central_offset;

  if (buffer_.size() > kMaxZip32) {
    return Status::Err(ErrorCode::InvalidArgument, "archive exceeds 4 GiB without ZIP64 support");
  }

  const auto entries = static_cast<std::uint16_t>(central_.size());
  format::PutU32(buffer_, format::kEndOfCentralSignature);
  format::PutU16(buffer_, 0); // this disk
  format::PutU16(buffer_, 0); // central directory disk
  format::PutU16(buffer_, entries);
  format::PutU16(buffer_, entries);
  format::PutU32(buffer_, static_cast<std::uint32_t>(central_size));
  format::PutU32(buffer_, static_cast<std::uint32_t>(central_offset));
  format::PutU16(buffer_, 0); // comment length

  return std::move(buffer_);
}

} // namespace roipack::archive
