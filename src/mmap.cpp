#include "mmap.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <unordered_set>

#include <fmt/core.h>
#include <mio/mmap.hpp>

struct MemoryMap_t {
  std::string path;
  size_t size = 0;
  mio::mmap_source src;
};

#if !defined(NDEBUG)
static std::unordered_set<MemoryMapHandle> gHandles;
#endif

MemoryMapStatus Mmap_Open(MemoryMapHandle &out,
                          const std::string &path,
                          std::string *err) {
  if (path.empty()) {
    if (err) {
      *err = "empty path";
    }
    return Mmap_Failure;
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (err) {
      *err = ec.message();
    }
    return Mmap_Failure;
  }

  // Permission problems surface here rather than at the first window
  auto *probe = std::fopen(path.c_str(), "rb");
  if (probe == nullptr) {
    if (err) {
      *err = std::strerror(errno);
    }
    return Mmap_Failure;
  }
  std::fclose(probe);

  auto *ret = new MemoryMap_t;
  ret->path = path;
  ret->size = size_t(size);
  out = ret;

#if !defined(NDEBUG)
  gHandles.insert(ret);
#endif

  return Mmap_OK;
}

size_t Mmap_Size(MemoryMapHandle file) {
  if (!file) {
    return 0;
  }

  return file->size;
}

MemoryMapStatus Mmap_Map(const char *&buf,
                         size_t &out_len,
                         MemoryMapHandle file,
                         size_t offset,
                         size_t len,
                         std::string *err) {
  if (!file) {
    return Mmap_InvalidHandle;
  }

  if (file->src.is_mapped()) {
    return Mmap_AlreadyMapped;
  }

  if (offset > file->size || len > file->size - offset) {
    if (err) {
      *err = fmt::format("window [{}, {}) outside of {} bytes", offset,
                         offset + len, file->size);
    }
    return Mmap_OutOfRange;
  }

  if (len == 0) {
    buf = nullptr;
    out_len = 0;
    return Mmap_OK;
  }

  // The file may have shrunk since Mmap_Open; touching a page past its end
  // raises SIGBUS
  std::error_code rc;
  auto sizNow = std::filesystem::file_size(file->path, rc);
  if (rc) {
    if (err) {
      *err = rc.message();
    }
    return Mmap_Failure;
  }

  if (offset > sizNow || len > sizNow - offset) {
    if (err) {
      *err = fmt::format("window [{}, {}) outside of {} bytes, file shrank",
                         offset, offset + len, sizNow);
    }
    return Mmap_OutOfRange;
  }

  file->src.map(file->path, offset, len, rc);

  if (rc) {
    if (err) {
      *err = rc.message();
    }
    return Mmap_Failure;
  }

  buf = file->src.data();
  out_len = file->src.size();

  return Mmap_OK;
}

MemoryMapStatus Mmap_Unmap(MemoryMapHandle file) {
  if (!file) {
    return Mmap_InvalidHandle;
  }

  if (!file->src.is_mapped()) {
    return Mmap_NotMapped;
  }

  file->src.unmap();
  return Mmap_OK;
}

MemoryMapStatus Mmap_Close(MemoryMapHandle &file) {
  if (!file) {
    return Mmap_InvalidHandle;
  }
#if !defined(NDEBUG)
  gHandles.erase(file);
#endif

  delete file;
  file = nullptr;
  return Mmap_OK;
}

MemoryMapStatus Mmap_CheckLeaks() {
#if defined(NDEBUG)
  return Mmap_OK;
#else
  if (gHandles.size() > 0) {
    for (auto &handle : gHandles) {
      fmt::print(stderr, "[mmap] leaked path='{}' is_mapped={}\n",
                 handle->path, handle->src.is_mapped());
    }
    return Mmap_Failure;
  }

  return Mmap_OK;
#endif
}
