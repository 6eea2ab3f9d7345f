#pragma once

#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

class DynamicLibraryHandle {
public:
  DynamicLibraryHandle() = default;
  ~DynamicLibraryHandle() { release(); }
  DynamicLibraryHandle(const DynamicLibraryHandle&) = delete;
  DynamicLibraryHandle& operator=(const DynamicLibraryHandle&) = delete;

  bool open(const std::string& path, std::string& outError) {
    release();
#ifdef _WIN32
    handle_ = ::LoadLibraryA(path.c_str());
    if (!handle_) {
      outError = "LoadLibrary failed (" + std::to_string(::GetLastError()) + ")";
      return false;
    }
#else
    handle_ = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_) {
      const char* e = ::dlerror();
      outError = e ? e : "dlopen failed";
      return false;
    }
#endif
    path_ = path;
    return true;
  }

  void* symbol(const char* name) const {
    if (!handle_) return nullptr;
#ifdef _WIN32
    return reinterpret_cast<void*>(::GetProcAddress(handle_, name));
#else
    return ::dlsym(handle_, name);
#endif
  }

  bool valid() const { return handle_ != nullptr; }
  const std::string& path() const { return path_; }

  void release() {
    if (handle_) {
#ifdef _WIN32
      ::FreeLibrary(handle_);
#else
      ::dlclose(handle_);
#endif
      handle_ = nullptr;
      path_.clear();
    }
  }

private:
#ifdef _WIN32
  HMODULE handle_ = nullptr;
#else
  void* handle_ = nullptr;
#endif
  std::string path_;
};
