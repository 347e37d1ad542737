#pragma once

#include "hostpulse.pb.h"

namespace hostpulse {

/// 单项主机指标的采集接口
class Monitor {
 public:
  Monitor() {}
  virtual ~Monitor() {}
  // 更新本周期的指标；失败只影响自己负责的字段
  virtual void update(proto::SystemInfo* info, proto::SystemStats* stats) = 0;
};

}  // namespace hostpulse
