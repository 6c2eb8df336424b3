#include "media_probe.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace {

uint32_t read_be32(const unsigned char* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t read_be64(const unsigned char* p) {
  return (static_cast<uint64_t>(read_be32(p)) << 32) | read_be32(p + 4);
}

uint16_t read_be16(const unsigned char* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

bool read_exact(std::ifstream& in, unsigned char* out, std::size_t size) {
  in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
  return static_cast<std::size_t>(in.gcount()) == size;
}

std::optional<ImageInfo> probe_png(std::ifstream& in) {
  // signature(8) length(4) "IHDR"(4) width(4) height(4)
  std::array<unsigned char, 24> header{};
  in.seekg(0);
  if(!read_exact(in, header.data(), header.size())) return std::nullopt;
  if(std::memcmp(header.data() + 12, "IHDR", 4) != 0) return std::nullopt;
  ImageInfo info{read_be32(header.data() + 16), read_be32(header.data() + 20)};
  if(info.width == 0 || info.height == 0) return std::nullopt;
  return info;
}

std::optional<ImageInfo> probe_jpeg(std::ifstream& in) {
  in.seekg(2);
  std::array<unsigned char, 4> marker{};
  while(read_exact(in, marker.data(), 2)) {
    if(marker[0] != 0xFF) return std::nullopt;
    unsigned char code = marker[1];
    while(code == 0xFF) {
      if(!read_exact(in, &code, 1)) return std::nullopt;
    }
    if(code == 0xD8 || (code >= 0xD0 && code <= 0xD7) || code == 0x01) continue;
    if(code == 0xD9 || code == 0xDA) return std::nullopt;
    if(!read_exact(in, marker.data(), 2)) return std::nullopt;
    uint16_t length = read_be16(marker.data());
    if(length < 2) return std::nullopt;
    bool sof = code >= 0xC0 && code <= 0xCF && code != 0xC4 && code != 0xC8 && code != 0xCC;
    if(sof) {
      // precision(1) height(2) width(2)
      std::array<unsigned char, 5> frame{};
      if(!read_exact(in, frame.data(), frame.size())) return std::nullopt;
      ImageInfo info{read_be16(frame.data() + 3), read_be16(frame.data() + 1)};
      if(info.width == 0 || info.height == 0) return std::nullopt;
      return info;
    }
    in.seekg(length - 2, std::ios::cur);
  }
  return std::nullopt;
}

struct BoxHeader {
  std::string type;
  uint64_t offset = 0;
  uint64_t size = 0;
  uint64_t header_size = 8;
};

std::optional<BoxHeader> read_box(std::ifstream& in, uint64_t offset, uint64_t limit) {
  if(offset + 8 > limit) return std::nullopt;
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  std::array<unsigned char, 16> raw{};
  if(!read_exact(in, raw.data(), 8)) return std::nullopt;
  BoxHeader box;
  box.offset = offset;
  box.size = read_be32(raw.data());
  box.type.assign(reinterpret_cast<const char*>(raw.data() + 4), 4);
  if(box.size == 1) {
    if(!read_exact(in, raw.data() + 8, 8)) return std::nullopt;
    box.size = read_be64(raw.data() + 8);
    box.header_size = 16;
  } else if(box.size == 0) {
    box.size = limit - offset;
  }
  if(box.size < box.header_size || offset + box.size > limit) return std::nullopt;
  return box;
}

std::optional<double> read_mvhd_duration(std::ifstream& in, const BoxHeader& box) {
  std::array<unsigned char, 32> body{};
  auto available = box.size - box.header_size;
  in.clear();
  in.seekg(static_cast<std::streamoff>(box.offset + box.header_size));
  if(available < 20 || !read_exact(in, body.data(), std::min<uint64_t>(available, body.size()))) {
    return std::nullopt;
  }
  uint8_t version = body[0];
  uint32_t timescale = 0;
  uint64_t duration = 0;
  if(version == 1) {
    if(available < 32) return std::nullopt;
    timescale = read_be32(body.data() + 20);
    duration = read_be64(body.data() + 24);
  } else {
    timescale = read_be32(body.data() + 12);
    duration = read_be32(body.data() + 16);
  }
  if(timescale == 0) return std::nullopt;
  return static_cast<double>(duration) / static_cast<double>(timescale);
}

} // namespace

std::optional<ImageInfo> probe_image(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  std::array<unsigned char, 8> magic{};
  if(!read_exact(in, magic.data(), magic.size())) return std::nullopt;
  static const unsigned char kPng[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if(std::memcmp(magic.data(), kPng, sizeof(kPng)) == 0) return probe_png(in);
  if(magic[0] == 0xFF && magic[1] == 0xD8) return probe_jpeg(in);
  return std::nullopt;
}

std::optional<VideoInfo> probe_video(const std::string& path) {
  std::error_code ec;
  auto file_size = std::filesystem::file_size(path, ec);
  if(ec) return std::nullopt;
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;

  uint64_t offset = 0;
  bool saw_ftyp = false;
  while(auto box = read_box(in, offset, file_size)) {
    if(box->type == "ftyp") saw_ftyp = true;
    if(box->type == "moov") {
      VideoInfo info;
      uint64_t child = box->offset + box->header_size;
      uint64_t end = box->offset + box->size;
      while(auto inner = read_box(in, child, end)) {
        if(inner->type == "mvhd") info.duration_seconds = read_mvhd_duration(in, *inner);
        if(inner->type == "trak") ++info.track_count;
        child += inner->size;
      }
      return info;
    }
    offset += box->size;
  }
  // moov missing (e.g. still being written); the container is still usable
  if(saw_ftyp) return VideoInfo{};
  return std::nullopt;
}

std::pair<uint32_t, uint32_t> aspect_fit(uint32_t width, uint32_t height,
                                         uint32_t max_width, uint32_t max_height) {
  if(width == 0 || height == 0 || max_width == 0 || max_height == 0) return {0, 0};
  double scale = std::min(static_cast<double>(max_width) / width,
                          static_cast<double>(max_height) / height);
  scale = std::min(scale, 1.0);
  auto w = static_cast<uint32_t>(width * scale + 0.5);
  auto h = static_cast<uint32_t>(height * scale + 0.5);
  return {std::max<uint32_t>(w, 1), std::max<uint32_t>(h, 1)};
}

std::shared_ptr<const Asset> ProbeAssetLoader::load(const std::string& path) {
  auto kind = media_kind_for_path(path);
  if(!kind) return nullptr;
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(ec) return nullptr;

  auto asset = std::make_shared<Asset>();
  asset->path = path;
  asset->kind = *kind;
  asset->file_size = static_cast<int64_t>(size);
  if(*kind == MediaKind::Video) {
    asset->video = probe_video(path);
    if(!asset->video) return nullptr;
  } else {
    asset->image = probe_image(path);
    if(asset->image) {
      auto fitted = aspect_fit(asset->image->width, asset->image->height, max_width_, max_height_);
      asset->target_width = fitted.first;
      asset->target_height = fitted.second;
    }
  }
  return asset;
}
