#pragma once

#include <cstddef>
#include <string>

typedef struct MemoryMap_t *MemoryMapHandle;

enum MemoryMapStatus {
  Mmap_OK,
  Mmap_Failure,
  Mmap_InvalidHandle,
  Mmap_AlreadyMapped,
  Mmap_NotMapped,
  Mmap_OutOfRange,
};

// Checks that `path` can be read and records its size; nothing is mapped yet
MemoryMapStatus Mmap_Open(MemoryMapHandle &out,
                          const std::string &path,
                          std::string *err = nullptr);
size_t Mmap_Size(MemoryMapHandle file);

// Maps [offset, offset + len). A zero-length window maps nothing and yields
// buf == nullptr.
MemoryMapStatus Mmap_Map(const char *&buf,
                         size_t &out_len,
                         MemoryMapHandle file,
                         size_t offset,
                         size_t len,
                         std::string *err = nullptr);
MemoryMapStatus Mmap_Unmap(MemoryMapHandle file);
MemoryMapStatus Mmap_Close(MemoryMapHandle &file);

MemoryMapStatus Mmap_CheckLeaks();
