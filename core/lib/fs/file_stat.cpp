// pkgindex/fs/file_stat.cpp - FileStat construction
#include "pkgindex/fs/file_stat.hpp"

#include <sys/stat.h>

namespace pkgindex::fs
{

bool FileStat::is_regular() const noexcept { return S_ISREG(mode); }

bool FileStat::is_symlink() const noexcept { return S_ISLNK(mode); }

FileStat FileStat::from_stat(std::string name, const struct stat & st)
{
  FileStat fi;
  fi.name = std::move(name);
  fi.size = static_cast<uint64_t>(st.st_size);
  fi.mode = static_cast<uint32_t>(st.st_mode);
#if defined(__APPLE__)
  fi.mtime_ns = static_cast<int64_t>(st.st_mtimespec.tv_sec) * 1000000000 +
                static_cast<int64_t>(st.st_mtimespec.tv_nsec);
#else
  fi.mtime_ns =
    static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000 + static_cast<int64_t>(st.st_mtim.tv_nsec);
#endif
  fi.is_dir = S_ISDIR(st.st_mode);
  fi.dev = static_cast<uint64_t>(st.st_dev);
  fi.ino = static_cast<uint64_t>(st.st_ino);
  return fi;
}

}  // namespace pkgindex::fs
