#include "kyc/Artifacts.h"
#include "kyc/Csv.h"
#include "kyc/Util.h"
#include <cmath>
#include <fstream>
#include <sstream>

namespace kyc {

namespace {
constexpr size_t kMaxWidth = 4096;
constexpr size_t kMaxTrees = 4096;
constexpr size_t kMaxNodesPerTree = 1 << 20;

struct Directive {
  std::string_view key;
  std::vector<std::string_view> args;
  size_t line{0};
};

std::vector<Directive> parse_directives(std::string_view text) {
  std::vector<Directive> out;
  size_t line_no = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    ++line_no;
    size_t hash = line.find('#');
    if (hash != std::string_view::npos) line = line.substr(0, hash);
    auto tokens = split_ws(line);
    if (!tokens.empty()) {
      Directive d{};
      d.key = tokens[0];
      d.args.assign(tokens.begin() + 1, tokens.end());
      d.line = line_no;
      out.push_back(std::move(d));
    }
    pos = end + 1;
  }
  return out;
}

std::string at_line(const Directive& d, const std::string& what) {
  return "line " + std::to_string(d.line) + ": " + what;
}

bool parse_doubles(const Directive& d, std::vector<double>& out, std::string& error) {
  out.clear();
  out.reserve(d.args.size());
  for (auto a : d.args) {
    double v = 0.0;
    if (!parse_double(a, v)) {
      error = at_line(d, "bad number '" + std::string(a) + "'");
      return false;
    }
    out.push_back(v);
  }
  return true;
}

bool parse_one_size(const Directive& d, size_t& out, std::string& error) {
  if (d.args.size() != 1 || !parse_size(d.args[0], out)) {
    error = at_line(d, "expected one non-negative integer after '" + std::string(d.key) + "'");
    return false;
  }
  return true;
}

bool parse_int(std::string_view s, int64_t& out) {
  double v = 0.0;
  if (!parse_double(s, v) || v != std::floor(v) || std::fabs(v) > 1e12) return false;
  out = static_cast<int64_t>(v);
  return true;
}

std::string_view expect_kind(const std::vector<Directive>& ds, std::string& error) {
  if (ds.empty()) {
    error = "empty artifact";
    return {};
  }
  if (ds[0].key != "kind" || ds[0].args.size() != 1) {
    error = at_line(ds[0], "artifact must start with 'kind <name>'");
    return {};
  }
  return ds[0].args[0];
}

std::unique_ptr<IClassifier> parse_logistic(const std::vector<Directive>& ds, std::string& error) {
  size_t width = 0;
  bool have_width = false;
  bool have_intercept = false;
  std::vector<double> weights;
  double intercept = 0.0;
  for (size_t i = 1; i < ds.size(); ++i) {
    const auto& d = ds[i];
    if (d.key == "width") {
      if (!parse_one_size(d, width, error)) return nullptr;
      have_width = true;
    } else if (d.key == "weights") {
      if (!parse_doubles(d, weights, error)) return nullptr;
    } else if (d.key == "intercept") {
      std::vector<double> v;
      if (!parse_doubles(d, v, error)) return nullptr;
      if (v.size() != 1) {
        error = at_line(d, "intercept takes one value");
        return nullptr;
      }
      intercept = v[0];
      have_intercept = true;
    } else {
      error = at_line(d, "unknown directive '" + std::string(d.key) + "'");
      return nullptr;
    }
  }
  if (weights.empty() || weights.size() > kMaxWidth) {
    error = "logistic model needs 1.." + std::to_string(kMaxWidth) + " weights";
    return nullptr;
  }
  if (have_width && width != weights.size()) {
    error = "width " + std::to_string(width) + " does not match " +
            std::to_string(weights.size()) + " weights";
    return nullptr;
  }
  if (!have_intercept) {
    error = "logistic model is missing 'intercept'";
    return nullptr;
  }
  return std::make_unique<LogisticClassifier>(std::move(weights), intercept);
}

bool validate_tree(const ForestTree& tree, size_t width, std::string& error) {
  for (size_t i = 0; i < tree.size(); ++i) {
    const auto& n = tree[i];
    if (n.leaf) {
      if (n.neg < 0.0 || n.pos < 0.0) {
        error = "node " + std::to_string(i) + " has negative class weight";
        return false;
      }
      continue;
    }
    if (n.feature >= width) {
      error = "node " + std::to_string(i) + " splits on feature " + std::to_string(n.feature) +
              " outside width " + std::to_string(width);
      return false;
    }
    // Children strictly after the parent: traversal always terminates.
    if (n.left <= static_cast<int32_t>(i) || n.right <= static_cast<int32_t>(i) ||
        n.left >= static_cast<int32_t>(tree.size()) || n.right >= static_cast<int32_t>(tree.size())) {
      error = "node " + std::to_string(i) + " has invalid children";
      return false;
    }
  }
  return true;
}

std::unique_ptr<IClassifier> parse_forest(const std::vector<Directive>& ds, std::string& error) {
  size_t width = 0;
  size_t declared_trees = 0;
  bool have_width = false;
  bool have_trees = false;
  std::vector<ForestTree> trees;
  size_t expected_nodes = 0;
  std::vector<bool> seen;

  auto close_tree = [&](const Directive* at) -> bool {
    if (trees.empty()) return true;
    for (size_t i = 0; i < seen.size(); ++i) {
      if (!seen[i]) {
        error = (at ? at_line(*at, "") : std::string()) + "tree " + std::to_string(trees.size() - 1) +
                " is missing node " + std::to_string(i);
        return false;
      }
    }
    return validate_tree(trees.back(), width, error);
  };

  for (size_t i = 1; i < ds.size(); ++i) {
    const auto& d = ds[i];
    if (d.key == "width") {
      if (!parse_one_size(d, width, error)) return nullptr;
      if (width == 0 || width > kMaxWidth) {
        error = at_line(d, "width out of range");
        return nullptr;
      }
      have_width = true;
    } else if (d.key == "trees") {
      if (!parse_one_size(d, declared_trees, error)) return nullptr;
      if (declared_trees == 0 || declared_trees > kMaxTrees) {
        error = at_line(d, "tree count out of range");
        return nullptr;
      }
      have_trees = true;
    } else if (d.key == "tree") {
      if (!have_width) {
        error = at_line(d, "'width' must precede trees");
        return nullptr;
      }
      if (!close_tree(&d)) return nullptr;
      if (!parse_one_size(d, expected_nodes, error)) return nullptr;
      if (expected_nodes == 0 || expected_nodes > kMaxNodesPerTree) {
        error = at_line(d, "node count out of range");
        return nullptr;
      }
      trees.emplace_back(expected_nodes);
      seen.assign(expected_nodes, false);
    } else if (d.key == "node") {
      if (trees.empty()) {
        error = at_line(d, "'node' before 'tree'");
        return nullptr;
      }
      if (d.args.size() != 7) {
        error = at_line(d, "node takes 7 values");
        return nullptr;
      }
      int64_t idx = 0, feature = 0, left = 0, right = 0;
      double threshold = 0.0, neg = 0.0, pos = 0.0;
      if (!parse_int(d.args[0], idx) || !parse_int(d.args[1], feature) ||
          !parse_double(d.args[2], threshold) || !parse_int(d.args[3], left) ||
          !parse_int(d.args[4], right) || !parse_double(d.args[5], neg) ||
          !parse_double(d.args[6], pos)) {
        error = at_line(d, "bad node values");
        return nullptr;
      }
      if (idx < 0 || static_cast<size_t>(idx) >= expected_nodes || seen[static_cast<size_t>(idx)]) {
        error = at_line(d, "node index out of range or repeated");
        return nullptr;
      }
      if (left > static_cast<int64_t>(kMaxNodesPerTree) || right > static_cast<int64_t>(kMaxNodesPerTree)) {
        error = at_line(d, "child index out of range");
        return nullptr;
      }
      bool leaf = left < 0 && right < 0;
      if (!leaf && (feature < 0 || feature > static_cast<int64_t>(kMaxWidth))) {
        error = at_line(d, "split node needs a feature index");
        return nullptr;
      }
      ForestNode& n = trees.back()[static_cast<size_t>(idx)];
      n.leaf = leaf;
      n.feature = leaf ? 0 : static_cast<uint32_t>(feature);
      n.threshold = threshold;
      n.left = static_cast<int32_t>(left);
      n.right = static_cast<int32_t>(right);
      n.neg = neg;
      n.pos = pos;
      seen[static_cast<size_t>(idx)] = true;
    } else {
      error = at_line(d, "unknown directive '" + std::string(d.key) + "'");
      return nullptr;
    }
  }
  if (!have_width || trees.empty()) {
    error = "forest model needs 'width' and at least one tree";
    return nullptr;
  }
  if (!close_tree(nullptr)) return nullptr;
  if (have_trees && declared_trees != trees.size()) {
    error = "declared " + std::to_string(declared_trees) + " trees, found " + std::to_string(trees.size());
    return nullptr;
  }
  return std::make_unique<ForestClassifier>(width, std::move(trees));
}
} // namespace

LogisticClassifier::LogisticClassifier(std::vector<double> weights, double intercept)
    : weights_(std::move(weights)), intercept_(intercept) {}

bool LogisticClassifier::predict(const FeatureVector& x, double& out) const {
  if (x.size() != weights_.size()) return false;
  double z = intercept_;
  for (size_t i = 0; i < weights_.size(); ++i) z += weights_[i] * x[i];
  if (!std::isfinite(z)) return false;
  out = 1.0 / (1.0 + std::exp(-z));
  return true;
}

ForestClassifier::ForestClassifier(size_t width, std::vector<ForestTree> trees)
    : width_(width), trees_(std::move(trees)) {}

bool ForestClassifier::predict(const FeatureVector& x, double& out) const {
  if (x.size() != width_) return false;
  double sum = 0.0;
  size_t voters = 0;
  for (const auto& tree : trees_) {
    size_t i = 0;
    while (!tree[i].leaf) {
      const auto& n = tree[i];
      i = static_cast<size_t>(x[n.feature] <= n.threshold ? n.left : n.right);
    }
    double mass = tree[i].neg + tree[i].pos;
    if (mass <= 0.0) continue;
    sum += tree[i].pos / mass;
    ++voters;
  }
  if (voters == 0) return false;
  out = sum / static_cast<double>(voters);
  return true;
}

FeatureSelector::FeatureSelector(size_t input_width, std::vector<size_t> indices)
    : input_width_(input_width), indices_(std::move(indices)) {}

bool FeatureSelector::apply(const FeatureVector& in, FeatureVector& out) const {
  if (in.size() != input_width_) return false;
  out.clear();
  out.reserve(indices_.size());
  for (size_t idx : indices_) {
    if (idx >= in.size()) return false;
    out.push_back(in[idx]);
  }
  return true;
}

StandardScaler::StandardScaler(std::vector<double> mean, std::vector<double> scale)
    : mean_(std::move(mean)), scale_(std::move(scale)) {
  for (auto& s : scale_) {
    if (s == 0.0) s = 1.0;
  }
}

bool StandardScaler::apply(const FeatureVector& in, FeatureVector& out) const {
  if (in.size() != mean_.size()) return false;
  out.resize(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    out[i] = (in[i] - mean_[i]) / scale_[i];
  }
  return true;
}

std::optional<double> FallbackTable::lookup(std::string_view document_number) const {
  auto it = entries_.find(std::string(trim(document_number)));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void FallbackTable::insert(std::string document_number, double probability) {
  entries_[std::move(document_number)] = probability;
}

bool read_text_file(const std::string& path, std::string& out, std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "cannot open " + path;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = "read error on " + path;
    return false;
  }
  out = ss.str();
  return true;
}

std::unique_ptr<IClassifier> parse_classifier(std::string_view text, std::string& error) {
  auto ds = parse_directives(text);
  std::string_view kind = expect_kind(ds, error);
  if (kind.empty()) return nullptr;
  if (kind == "logistic") return parse_logistic(ds, error);
  if (kind == "forest") return parse_forest(ds, error);
  error = "unsupported classifier kind '" + std::string(kind) + "'";
  return nullptr;
}

std::optional<FeatureSelector> parse_selector(std::string_view text, std::string& error) {
  auto ds = parse_directives(text);
  std::string_view kind = expect_kind(ds, error);
  if (kind.empty()) return std::nullopt;
  if (kind != "selector") {
    error = "expected 'kind selector', got '" + std::string(kind) + "'";
    return std::nullopt;
  }
  size_t width = 0;
  bool have_width = false;
  std::vector<size_t> indices;
  for (size_t i = 1; i < ds.size(); ++i) {
    const auto& d = ds[i];
    if (d.key == "input_width") {
      if (!parse_one_size(d, width, error)) return std::nullopt;
      have_width = true;
    } else if (d.key == "indices") {
      indices.clear();
      for (auto a : d.args) {
        size_t v = 0;
        if (!parse_size(a, v)) {
          error = at_line(d, "bad index '" + std::string(a) + "'");
          return std::nullopt;
        }
        indices.push_back(v);
      }
    } else {
      error = at_line(d, "unknown directive '" + std::string(d.key) + "'");
      return std::nullopt;
    }
  }
  if (!have_width || width == 0 || width > kMaxWidth) {
    error = "selector needs 'input_width' in 1.." + std::to_string(kMaxWidth);
    return std::nullopt;
  }
  if (indices.empty()) {
    error = "selector keeps no features";
    return std::nullopt;
  }
  for (size_t idx : indices) {
    if (idx >= width) {
      error = "selector index " + std::to_string(idx) + " outside input width " + std::to_string(width);
      return std::nullopt;
    }
  }
  return FeatureSelector(width, std::move(indices));
}

std::optional<StandardScaler> parse_scaler(std::string_view text, std::string& error) {
  auto ds = parse_directives(text);
  std::string_view kind = expect_kind(ds, error);
  if (kind.empty()) return std::nullopt;
  if (kind != "scaler") {
    error = "expected 'kind scaler', got '" + std::string(kind) + "'";
    return std::nullopt;
  }
  std::vector<double> mean;
  std::vector<double> scale;
  for (size_t i = 1; i < ds.size(); ++i) {
    const auto& d = ds[i];
    if (d.key == "mean") {
      if (!parse_doubles(d, mean, error)) return std::nullopt;
    } else if (d.key == "scale") {
      if (!parse_doubles(d, scale, error)) return std::nullopt;
    } else {
      error = at_line(d, "unknown directive '" + std::string(d.key) + "'");
      return std::nullopt;
    }
  }
  if (mean.empty() || mean.size() != scale.size() || mean.size() > kMaxWidth) {
    error = "scaler needs 'mean' and 'scale' of the same non-zero length";
    return std::nullopt;
  }
  return StandardScaler(std::move(mean), std::move(scale));
}

std::optional<FallbackTable> parse_fallback_table(std::string_view csv, std::string& error,
                                                  FallbackLoadStats* stats) {
  FallbackLoadStats local{};
  FallbackLoadStats& st = stats ? *stats : local;
  st = FallbackLoadStats{};

  CsvReader reader(csv);
  CsvRecord rec;
  size_t doc_col = 0;
  size_t prob_col = 0;
  bool have_header = false;
  FallbackTable table;

  while (reader.next(rec)) {
    if (is_blank_record(rec)) continue;
    if (!have_header) {
      bool found_doc = false;
      bool found_prob = false;
      for (size_t i = 0; i < rec.fields.size(); ++i) {
        std::string h = to_lower(trim(rec.fields[i]));
        if (h == "document_number") { doc_col = i; found_doc = true; }
        if (h == "gnn_fraud_probability") { prob_col = i; found_prob = true; }
      }
      if (!found_doc || !found_prob) {
        error = "fallback table header must contain Document_Number and GNN_Fraud_Probability";
        return std::nullopt;
      }
      have_header = true;
      continue;
    }
    ++st.rows;
    double p = 0.0;
    if (rec.fields.size() <= doc_col || rec.fields.size() <= prob_col ||
        trim(rec.fields[doc_col]).empty() || !parse_double(rec.fields[prob_col], p) ||
        p < 0.0 || p > 1.0) {
      ++st.skipped;
      continue;
    }
    // First occurrence wins, as a row lookup would find it.
    if (!table.lookup(rec.fields[doc_col])) {
      table.insert(std::string(trim(rec.fields[doc_col])), p);
    }
  }
  if (reader.error() != CsvError::None) {
    error = "line " + std::to_string(reader.error_line()) + ": " + std::string(to_string(reader.error()));
    return std::nullopt;
  }
  // A header-only or empty file is a valid empty table.
  return table;
}

} // namespace kyc
