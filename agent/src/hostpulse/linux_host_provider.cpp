#include "hostpulse/linux_host_provider.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "util/readfile.hpp"

namespace hostpulse {

namespace fs = std::filesystem;

namespace {
constexpr uint64_t kSectorSize = 512;

uint64_t to_u64(const std::string& s) {
  return std::strtoull(s.c_str(), nullptr, 10);
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// /proc/mounts 中空格等字符以八进制转义（\040）
std::string unescape_mount_field(const std::string& field) {
  std::string out;
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() &&
        std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
        std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
        std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
      out.push_back(static_cast<char>(std::strtol(field.substr(i + 1, 3).c_str(), nullptr, 8)));
      i += 3;
    } else {
      out.push_back(field[i]);
    }
  }
  return out;
}

// 按 "key : value" 解析 /proc/cpuinfo
bool read_cpuinfo(const std::string& path,
                  std::vector<std::pair<std::string, std::string>>* entries) {
  ReadFile file(path);
  if (!file.is_open()) {
    return false;
  }
  std::string line;
  while (file.read_raw_line(&line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    entries->emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
  }
  return true;
}

bool read_sensor_file(const fs::path& path, double* value) {
  std::string word;
  if (!ReadFile::read_first_word(path.string(), &word)) {
    return false;
  }
  char* end = nullptr;
  double raw = std::strtod(word.c_str(), &end);
  if (end == word.c_str()) {
    return false;
  }
  *value = raw;
  return true;
}

std::vector<fs::path> sorted_entries(const fs::path& dir) {
  std::vector<fs::path> paths;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    paths.push_back(it->path());
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}
}  // namespace

LinuxHostProvider::LinuxHostProvider(std::string proc_root, std::string sys_root)
    : _proc_root(std::move(proc_root)), _sys_root(std::move(sys_root)) {}

std::string LinuxHostProvider::proc_path(const std::string& name) const {
  return _proc_root + "/" + name;
}

bool LinuxHostProvider::cpu_percent(double* percent) {
  ReadFile file(proc_path("stat"));
  std::vector<std::string> args;
  if (!file.is_open() || !file.read_line(&args) || args.size() < 8 || args[0] != "cpu") {
    return false;
  }
  // cpu user nice system idle iowait irq softirq steal ...
  uint64_t user = to_u64(args[1]);
  uint64_t nice = to_u64(args[2]);
  uint64_t system = to_u64(args[3]);
  uint64_t idle = to_u64(args[4]);
  uint64_t iowait = to_u64(args[5]);
  uint64_t irq = to_u64(args[6]);
  uint64_t softirq = to_u64(args[7]);
  uint64_t steal = args.size() > 8 ? to_u64(args[8]) : 0;

  uint64_t busy = user + nice + system + irq + softirq + steal;
  uint64_t total = busy + idle + iowait;

  double pct = 0;
  if (_has_last_cpu && total > _last_cpu_total && busy >= _last_cpu_busy) {
    pct = static_cast<double>(busy - _last_cpu_busy) /
          static_cast<double>(total - _last_cpu_total) * 100.0;
  } else if (!_has_last_cpu && total > 0) {
    pct = static_cast<double>(busy) / static_cast<double>(total) * 100.0;
  }
  _last_cpu_busy = busy;
  _last_cpu_total = total;
  _has_last_cpu = true;
  *percent = pct;
  return true;
}

bool LinuxHostProvider::virtual_memory(MemoryUsage* usage) {
  ReadFile file(proc_path("meminfo"));
  if (!file.is_open()) {
    return false;
  }
  std::unordered_map<std::string, uint64_t> values;
  std::vector<std::string> args;
  while (file.read_line(&args)) {
    if (args.size() < 2) continue;
    std::string key = args[0];
    if (!key.empty() && key.back() == ':') key.pop_back();
    values[key] = to_u64(args[1]) * 1024;  // kB
  }
  auto total_it = values.find("MemTotal");
  if (total_it == values.end() || total_it->second == 0) {
    return false;
  }
  MemoryUsage out;
  out.total = total_it->second;
  out.free = values["MemFree"];
  uint64_t cached = values["Cached"] + values["SReclaimable"];
  uint64_t buffers = values["Buffers"];
  if (out.total >= out.free + buffers + cached) {
    out.used = out.total - out.free - buffers - cached;
  } else if (values.count("MemAvailable") && out.total >= values["MemAvailable"]) {
    out.used = out.total - values["MemAvailable"];
  }
  out.used_percent = static_cast<double>(out.used) / static_cast<double>(out.total) * 100.0;
  out.swap_total = values["SwapTotal"];
  out.swap_free = values["SwapFree"];
  *usage = out;
  return true;
}

bool LinuxHostProvider::disk_usage(const std::string& mountpoint, DiskUsage* usage) {
  struct statvfs st {};
  if (statvfs(mountpoint.c_str(), &st) != 0) {
    return false;
  }
  uint64_t frsize = st.f_frsize ? st.f_frsize : st.f_bsize;
  DiskUsage out;
  out.total = static_cast<uint64_t>(st.f_blocks) * frsize;
  out.free = static_cast<uint64_t>(st.f_bavail) * frsize;
  out.used = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * frsize;
  if (out.used + out.free > 0) {
    out.used_percent = static_cast<double>(out.used) /
                       static_cast<double>(out.used + out.free) * 100.0;
  }
  *usage = out;
  return true;
}

bool LinuxHostProvider::disk_io_counters(const std::vector<std::string>& names,
                                         std::vector<DiskIoCounters>* counters) {
  ReadFile file(proc_path("diskstats"));
  if (!file.is_open()) {
    return false;
  }
  std::unordered_set<std::string> wanted(names.begin(), names.end());
  counters->clear();
  std::vector<std::string> args;
  while (file.read_line(&args)) {
    // major minor name reads merged sectors_read ms writes merged sectors_written ...
    if (args.size() < 10) continue;
    const std::string& name = args[2];
    if (!wanted.empty() && wanted.count(name) == 0) continue;
    DiskIoCounters c;
    c.name = name;
    c.read_bytes = to_u64(args[5]) * kSectorSize;
    c.write_bytes = to_u64(args[9]) * kSectorSize;
    counters->push_back(std::move(c));
  }
  return true;
}

bool LinuxHostProvider::net_io_counters(std::vector<NetIoCounters>* counters) {
  ReadFile file(proc_path("net/dev"));
  if (!file.is_open()) {
    return false;
  }
  counters->clear();
  std::string line;
  while (file.read_raw_line(&line)) {
    // 前两行为表头
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    NetIoCounters c;
    c.name = trim(line.substr(0, colon));
    std::istringstream fields(line.substr(colon + 1));
    std::vector<uint64_t> values;
    uint64_t v = 0;
    while (fields >> v) {
      values.push_back(v);
    }
    // 接收: bytes packets errs drop fifo frame compressed multicast; 发送: bytes ...
    if (c.name.empty() || values.size() < 9) continue;
    c.bytes_recv = values[0];
    c.bytes_sent = values[8];
    counters->push_back(std::move(c));
  }
  return true;
}

bool LinuxHostProvider::temperatures(std::vector<SensorReading>* readings) {
  readings->clear();
  fs::path hwmon_root = fs::path(_sys_root) / "class" / "hwmon";
  std::error_code ec;
  bool any_source = fs::exists(hwmon_root, ec);

  // hwmon: <name>_<label> -> temp*_input（毫摄氏度）
  for (const auto& hwmon : sorted_entries(hwmon_root)) {
    std::string chip;
    if (!ReadFile::read_first_word((hwmon / "name").string(), &chip)) {
      chip = hwmon.filename().string();
    }
    chip = to_lower(chip);
    for (const auto& entry : sorted_entries(hwmon)) {
      std::string file = entry.filename().string();
      auto suffix = file.find("_input");
      if (file.rfind("temp", 0) != 0 || suffix == std::string::npos) continue;
      double milli = 0;
      if (!read_sensor_file(entry, &milli)) continue;

      std::string label;
      ReadFile label_file((hwmon / (file.substr(0, suffix) + "_label")).string());
      std::string raw;
      if (label_file.is_open() && label_file.read_raw_line(&raw)) {
        raw = to_lower(trim(raw));
        raw.erase(std::remove(raw.begin(), raw.end(), ' '), raw.end());
        if (!raw.empty()) label = "_" + raw;
      }
      readings->push_back(SensorReading{chip + label, milli / 1000.0});
    }
  }
  if (!readings->empty()) {
    return true;
  }

  // 回退到 thermal_zone
  fs::path thermal_root = fs::path(_sys_root) / "class" / "thermal";
  any_source = fs::exists(thermal_root, ec) || any_source;
  for (const auto& zone : sorted_entries(thermal_root)) {
    if (zone.filename().string().rfind("thermal_zone", 0) != 0) continue;
    double milli = 0;
    if (!read_sensor_file(zone / "temp", &milli)) continue;
    std::string type;
    if (!ReadFile::read_first_word((zone / "type").string(), &type)) {
      type = zone.filename().string();
    }
    readings->push_back(SensorReading{to_lower(type), milli / 1000.0});
  }
  return any_source;
}

bool LinuxHostProvider::host_info(HostInfo* info) {
  char hostname[256] = {0};
  if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
    return false;
  }
  struct utsname uts {};
  if (uname(&uts) != 0) {
    return false;
  }
  std::string uptime;
  if (!ReadFile::read_first_word(proc_path("uptime"), &uptime)) {
    return false;
  }
  info->hostname = hostname;
  info->kernel_version = uts.release;
  info->uptime = static_cast<uint64_t>(std::strtod(uptime.c_str(), nullptr));
  return true;
}

bool LinuxHostProvider::cpu_model(std::string* model) {
  std::vector<std::pair<std::string, std::string>> entries;
  if (!read_cpuinfo(proc_path("cpuinfo"), &entries)) {
    return false;
  }
  for (const auto& [key, value] : entries) {
    if (key == "model name" || key == "Model" || key == "Processor" || key == "cpu model") {
      *model = value;
      return true;
    }
  }
  return false;
}

bool LinuxHostProvider::cpu_counts(bool logical, int* count) {
  std::vector<std::pair<std::string, std::string>> entries;
  bool have_cpuinfo = read_cpuinfo(proc_path("cpuinfo"), &entries);

  int processors = 0;
  std::set<std::pair<std::string, std::string>> cores;
  std::unordered_map<std::string, int> cores_per_package;
  std::string physical_id;
  for (const auto& [key, value] : entries) {
    if (key == "processor") {
      ++processors;
      physical_id.clear();
    } else if (key == "physical id") {
      physical_id = value;
    } else if (key == "core id") {
      cores.emplace(physical_id, value);
    } else if (key == "cpu cores") {
      cores_per_package[physical_id] = std::atoi(value.c_str());
    }
  }

  if (logical) {
    if (processors == 0) {
      long online = sysconf(_SC_NPROCESSORS_ONLN);
      if (online <= 0) return false;
      processors = static_cast<int>(online);
    }
    *count = processors;
    return true;
  }

  if (!have_cpuinfo) {
    return false;
  }
  if (!cores.empty()) {
    *count = static_cast<int>(cores.size());
    return true;
  }
  int sum = 0;
  for (const auto& [pkg, n] : cores_per_package) sum += n;
  if (sum > 0) {
    *count = sum;
    return true;
  }
  // 没有拓扑信息（部分 ARM/虚拟机），按逻辑数计
  if (processors > 0) {
    *count = processors;
    return true;
  }
  return false;
}

bool LinuxHostProvider::partitions(std::vector<Partition>* parts) {
  // /proc/filesystems 中不带 nodev 的为块设备文件系统
  std::unordered_set<std::string> physical;
  {
    ReadFile file(proc_path("filesystems"));
    std::vector<std::string> args;
    while (file.is_open() && file.read_line(&args)) {
      if (args.size() == 1) physical.insert(args[0]);
    }
  }
  ReadFile file(proc_path("self/mounts"));
  if (!file.is_open()) {
    return false;
  }
  parts->clear();
  std::vector<std::string> args;
  while (file.read_line(&args)) {
    if (args.size() < 3) continue;
    if (!physical.empty() && physical.count(args[2]) == 0) continue;
    parts->push_back(Partition{unescape_mount_field(args[0]),
                               unescape_mount_field(args[1]), args[2]});
  }
  return true;
}

}  // namespace hostpulse
