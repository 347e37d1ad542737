#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace hostpulse {
// 按行读取 /proc、/sys 下的文本文件
class ReadFile {
 public:
  explicit ReadFile(const std::string& name) : _file_stream(name) {}

  ~ReadFile() {
    if (_file_stream.is_open())
      _file_stream.close();
  }

  bool is_open() const { return _file_stream.is_open(); }

  // 读取一行并按空白分割成单词存入 args；文件结束返回 false
  bool read_line(std::vector<std::string>* args) {
    std::string line;
    args->clear();
    if (!std::getline(_file_stream, line)) {
      return false;
    }
    std::istringstream line_stream(line);
    std::string word;
    while (line_stream >> word) {
      args->push_back(word);
    }
    return true;
  }

  // 读取一整行原文
  bool read_raw_line(std::string* line) {
    return static_cast<bool>(std::getline(_file_stream, *line));
  }

  // 读取单值文件（如 /sys 下的 temp*_input、name）的首个单词
  static bool read_first_word(const std::string& name, std::string* word) {
    ReadFile file(name);
    std::vector<std::string> args;
    if (!file.is_open() || !file.read_line(&args) || args.empty()) {
      return false;
    }
    *word = args[0];
    return true;
  }

 private:
  std::ifstream _file_stream;
};

}  // namespace hostpulse
