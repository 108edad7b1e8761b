//Write_File.h - A part of Kinefit 2026.

#pragma once

#include <functional>
#include <string>
#include <filesystem>

namespace kfit {

// Derive a name suitable for a boost::interprocess::named_mutex from a file path.
//
// Named mutexes cannot contain path separators, so the path is hashed. The same path always yields the same name.
std::string
Mutex_Name_For_File(const std::filesystem::path &file_name);

// This routine will write text to a file, protecting the write with a semaphore from concurrrent processes.
// The filename is claimed after the semaphore is acquired to avoid a race condition.
//
// 'iff_newfile' is written before 'body' only when the file did not previously exist. Returns true in that case.
bool Append_File( const std::function<std::filesystem::path(void)>& gen_file_name,
                  const std::string& mutex_name,
                  const std::string& iff_newfile,
                  const std::string& body );

// Replaces the file's contents with 'contents' under the same semaphore used by Append_File.
//
// Used to start a fresh file that subsequent calls to Append_File extend.
void Overwrite_File( const std::function<std::filesystem::path(void)>& gen_file_name,
                     const std::string& mutex_name,
                     const std::string& contents );

} // namespace kfit
