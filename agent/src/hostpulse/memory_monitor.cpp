#include "hostpulse/memory_monitor.hpp"

#include "hostpulse/rate.hpp"
#include "util/logging.hpp"

namespace hostpulse {

void MemoryMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  MemoryUsage mem;
  if (!_provider.virtual_memory(&mem)) {
    agent_log().error("Error getting memory stats");
    return;
  }
  stats->set_mem(bytes_to_gigabytes(mem.total));
  stats->set_mem_used(bytes_to_gigabytes(mem.used));
  // buff/cache = total - free - used
  uint64_t buff_cache = mem.total >= mem.free + mem.used ? mem.total - mem.free - mem.used : 0;
  stats->set_mem_buff_cache(bytes_to_gigabytes(buff_cache));
  stats->set_mem_pct(two_decimals(mem.used_percent));
  stats->set_swap(bytes_to_gigabytes(mem.swap_total));
  uint64_t swap_used = mem.swap_total >= mem.swap_free ? mem.swap_total - mem.swap_free : 0;
  stats->set_swap_used(bytes_to_gigabytes(swap_used));
}

}  // namespace hostpulse
