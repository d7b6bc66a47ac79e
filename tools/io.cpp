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

#include "tools/io.h"

#include <cstring>

namespace {
// Appends the contents of |file| to |data|.
void ReadFile(FILE* file, std::string* data) {
  if (file == nullptr) return;

  const int buf_size = 1024;
  char buf[buf_size];
  while (size_t len = fread(buf, 1, buf_size, file)) {
    data->append(buf, len);
  }
}

// Returns false, after writing an error message to standard error, if |file|
// could not be opened or read.
bool WasFileCorrectlyRead(FILE* file, const char* filename) {
  if (file == nullptr) {
    fprintf(stderr, "error: file does not exist '%s'\n", filename);
    return false;
  }

  if (ferror(file)) {
    fprintf(stderr, "error: error reading file '%s'\n",
            filename ? filename : "-");
    return false;
  }
  return true;
}

bool UsesStandardStream(const char* filename) {
  return !filename || strcmp("-", filename) == 0;
}
}  // namespace

bool ReadTextFile(const char* filename, std::string* data) {
  data->clear();

  const bool use_file = !UsesStandardStream(filename);
  FILE* fp = use_file ? fopen(filename, "r") : stdin;

  ReadFile(fp, data);
  bool succeeded = WasFileCorrectlyRead(fp, filename);
  if (use_file && fp) fclose(fp);
  return succeeded;
}

bool ReadLines(const char* filename, std::vector<std::string>* lines) {
  std::string contents;
  if (!ReadTextFile(filename, &contents)) {
    return false;
  }

  size_t begin = 0;
  while (begin < contents.size()) {
    size_t end = contents.find('\n', begin);
    if (end == std::string::npos) {
      end = contents.size();
    }
    lines->push_back(contents.substr(begin, end - begin));
    begin = end + 1;
  }
  return true;
}

OutputFile::OutputFile(const char* filename, const char* mode)
    : fp_(UsesStandardStream(filename) ? stdout : fopen(filename, mode)) {}

OutputFile::~OutputFile() {
  if (fp_ == stdout) {
    fflush(stdout);
  } else if (fp_ != nullptr) {
    fclose(fp_);
  }
}

bool OutputFile::WriteLine(const std::string& line) {
  if (fp_ == nullptr) {
    return false;
  }
  if (fwrite(line.data(), 1, line.size(), fp_) != line.size() ||
      fputc('\n', fp_) == EOF) {
    return false;
  }
  return fflush(fp_) == 0;
}

template <typename T>
bool WriteFile(const char* filename, const char* mode, const T* data,
               size_t count) {
  OutputFile file(filename, mode);
  FILE* fp = file.GetFileHandle();
  if (fp == nullptr) {
    fprintf(stderr, "error: could not open file '%s'\n", filename);
    return false;
  }

  size_t written = fwrite(data, sizeof(T), count, fp);
  if (count != written) {
    fprintf(stderr, "error: could not write to file '%s'\n", filename);
    return false;
  }

  return true;
}

template bool WriteFile<char>(const char* filename, const char* mode,
                              const char* data, size_t count);
