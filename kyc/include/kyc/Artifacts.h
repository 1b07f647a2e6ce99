#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "Common.h"

namespace kyc {

// Artifacts are exported from the training side as plain text, one directive
// per line ("key value..."), '#' starts a comment:
//
//   kind logistic            kind forest               kind selector      kind scaler
//   width 8                  width 8                   input_width 8      mean 9.1 12.0 ...
//   weights 0.2 -0.1 ...     trees 2                   indices 0 1 4 5    scale 2.3 1.0 ...
//   intercept -1.5           tree 3
//                            node 0 4 0.5 1 2 0 0
//                            node 1 -1 0 -1 -1 8 2
//                            node 2 -1 0 -1 -1 1 9
//                            tree ...
//
// Forest nodes are "node <idx> <feature> <threshold> <left> <right> <neg> <pos>";
// leaves have left = right = -1 and children must follow their parent.

class IClassifier {
 public:
  virtual ~IClassifier() = default;
  virtual std::string_view kind() const = 0;
  virtual size_t input_width() const = 0;
  // Positive-class probability. False when the input cannot be scored.
  virtual bool predict(const FeatureVector& x, double& out) const = 0;
};

class LogisticClassifier final : public IClassifier {
 public:
  LogisticClassifier(std::vector<double> weights, double intercept);
  std::string_view kind() const override { return "logistic"; }
  size_t input_width() const override { return weights_.size(); }
  bool predict(const FeatureVector& x, double& out) const override;

 private:
  std::vector<double> weights_;
  double intercept_{0.0};
};

struct ForestNode {
  uint32_t feature{0};
  double threshold{0.0};
  int32_t left{-1};
  int32_t right{-1};
  double neg{0.0};
  double pos{0.0};
  bool leaf{true};
};

using ForestTree = std::vector<ForestNode>;

class ForestClassifier final : public IClassifier {
 public:
  ForestClassifier(size_t width, std::vector<ForestTree> trees);
  std::string_view kind() const override { return "forest"; }
  size_t input_width() const override { return width_; }
  bool predict(const FeatureVector& x, double& out) const override;

 private:
  size_t width_{0};
  std::vector<ForestTree> trees_;
};

// Column subset and order applied before scaling.
class FeatureSelector {
 public:
  FeatureSelector(size_t input_width, std::vector<size_t> indices);
  size_t input_width() const { return input_width_; }
  size_t output_width() const { return indices_.size(); }
  bool apply(const FeatureVector& in, FeatureVector& out) const;

 private:
  size_t input_width_{0};
  std::vector<size_t> indices_;
};

class StandardScaler {
 public:
  StandardScaler(std::vector<double> mean, std::vector<double> scale);
  size_t width() const { return mean_.size(); }
  bool apply(const FeatureVector& in, FeatureVector& out) const;

 private:
  std::vector<double> mean_;
  std::vector<double> scale_;
};

// Precomputed prior evaluations keyed by document number.
// CSV columns: Document_Number, GNN_Fraud_Probability (0..1).
class FallbackTable {
 public:
  std::optional<double> lookup(std::string_view document_number) const;
  size_t size() const { return entries_.size(); }
  void insert(std::string document_number, double probability);

 private:
  std::unordered_map<std::string, double> entries_;
};

struct FallbackLoadStats {
  size_t rows{0};
  size_t skipped{0};
};

bool read_text_file(const std::string& path, std::string& out, std::string& error);

std::unique_ptr<IClassifier> parse_classifier(std::string_view text, std::string& error);
std::optional<FeatureSelector> parse_selector(std::string_view text, std::string& error);
std::optional<StandardScaler> parse_scaler(std::string_view text, std::string& error);
std::optional<FallbackTable> parse_fallback_table(std::string_view csv, std::string& error,
                                                  FallbackLoadStats* stats = nullptr);

} // namespace kyc
