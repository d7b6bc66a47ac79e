// Copyright (c) 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TOOLS_IO_H_
#define TOOLS_IO_H_

#include <cstdio>
#include <string>
#include <vector>

// Sets |data| to the contents of the file named |filename|.  If |filename| is
// nullptr or "-", reads from the standard input.  If any error occurs, writes
// error messages to standard error and returns false.
bool ReadTextFile(const char* filename, std::string* data);

// Appends the lines of the file named |filename| to |lines|, without their
// line terminators.  A final line without terminator is kept; a trailing
// terminator does not start an extra empty line.  Same conventions as
// ReadTextFile().
bool ReadLines(const char* filename, std::vector<std::string>* lines);

// Writes the given |data| into the file named as |filename| using the given
// |mode|, assuming |data| is an array of |count| elements of type |T|. If
// |filename| is nullptr or "-", writes to standard output. If any error occurs,
// returns false and outputs error message to standard error.
template <typename T>
bool WriteFile(const char* filename, const char* mode, const T* data,
               size_t count);

// A file opened for output, closed on destruction.  Standard output is used
// when the file name is nullptr or "-".
class OutputFile {
 public:
  OutputFile(const char* filename, const char* mode);
  ~OutputFile();

  OutputFile(const OutputFile&) = delete;
  OutputFile& operator=(const OutputFile&) = delete;

  // Returns a file handle to the file, or nullptr if it could not be opened.
  FILE* GetFileHandle() const { return fp_; }

  // Writes |line| followed by a newline and flushes, so that a worker that is
  // killed keeps what it has found.  Returns false on failure.
  bool WriteLine(const std::string& line);

 private:
  FILE* fp_;
};

#endif  // TOOLS_IO_H_
