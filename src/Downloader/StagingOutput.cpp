#include "StagingOutput.hpp"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "errors.hpp"
#include "logger.hpp"

namespace rangefetch {

StagingOutput::StagingOutput(const std::string& destination)
    : destination_(destination), bytesMerged_(0) {}

StagingOutput::~StagingOutput() {
  if (out_.is_open()) out_.close();
}

void StagingOutput::open() {
  out_.open(destination_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw PreconditionError("failed to create output file: " + destination_);
  }
  bytesMerged_ = 0;
}

std::string StagingOutput::stagingPath(size_t chunkId) const {
  std::ostringstream oss;
  oss << destination_ << ".part" << chunkId;
  return oss.str();
}

void StagingOutput::writeChunk(const Chunk& chunk,
                               const std::string& data) const {
  const std::string partFile = stagingPath(chunk.id);
  std::ofstream ofs(partFile, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw OutputError("failed to open part file: " + partFile);
  }
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  ofs.close();
  if (!ofs) {
    throw OutputError("failed to write part file: " + partFile);
  }
}

void StagingOutput::mergeChunk(const Chunk& chunk) {
  if (!out_.is_open()) {
    throw OutputError("output file not open: " + destination_);
  }
  const std::string partFile = stagingPath(chunk.id);
  std::error_code ec;
  auto partSize = std::filesystem::file_size(partFile, ec);
  if (ec) {
    throw StagingError("part file " + partFile + " unreadable: " +
                       ec.message());
  }
  if (partSize != chunk.length()) {
    throw StagingError("part file " + partFile + " holds " +
                       std::to_string(partSize) + " bytes, expected " +
                       std::to_string(chunk.length()));
  }

  std::ifstream ifs(partFile, std::ios::binary);
  if (!ifs) throw StagingError("failed to open part file: " + partFile);
  if (partSize > 0) {
    out_ << ifs.rdbuf();
  }
  if (!out_) {
    throw OutputError("failed to append " + partFile + " to " + destination_);
  }
  ifs.close();
  bytesMerged_ += partSize;

  if (std::remove(partFile.c_str()) != 0) {
    LOG(WARN) << "Could not remove part file " << partFile;
  }
}

void StagingOutput::finalize(uint64_t expectedSize) {
  if (out_.is_open()) {
    out_.flush();
    out_.close();
    if (!out_) {
      throw OutputError("failed to close output file: " + destination_);
    }
  }
  if (bytesMerged_ != expectedSize) {
    throw OutputError("output file " + destination_ + " has " +
                      std::to_string(bytesMerged_) + " bytes, expected " +
                      std::to_string(expectedSize));
  }
}

void StagingOutput::discardStaging(const std::vector<Chunk>& chunks) const {
  for (const auto& chunk : chunks) {
    std::error_code ec;
    std::filesystem::remove(stagingPath(chunk.id), ec);
    if (ec) {
      LOG(WARN) << "Could not remove part file " << stagingPath(chunk.id)
                << ": " << ec.message();
    }
  }
}

}  // namespace rangefetch
