#pragma once
#include <string>
#include <string_view>
#include "AuditLog.h"
#include "Batch.h"
#include "Log.h"
#include "ModelBundle.h"
#include "Pipeline.h"

namespace kyc {

struct LogConfig {
  LogLevel level{LogLevel::Info};
};

struct KycConfig {
  ModelBundleConfig model{};
  PipelineConfig pipeline{};
  AuditLogConfig audit{};
  BatchConfig batch{};
  LogConfig log{};
};

struct ConfigResult {
  bool ok{false};
  std::string error; // "<path>:<line>: ..." for the first bad line
};

// "key value" per line, '#' starts a comment. Keys:
//   model.classifier model.selector model.scaler model.fallback model.safe_default
//   risk.low_upper risk.high_lower risk.address_min_len
//   validation.max_name_len validation.max_document_number_len validation.max_address_len
//   audit.path audit.sync
//   batch.max_workers batch.max_rows
//   log.level
// Keys not present keep their defaults. Stops at the first unknown key or bad value.
ConfigResult parse_config(std::string_view text, KycConfig& cfg, std::string_view origin = "config");
ConfigResult load_config(const std::string& path, KycConfig& cfg);

} // namespace kyc
