#include "match/match_engine.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <map>
#include <numeric>

#include "util/exception.h"
#include "util/math_utils.h"

namespace bandprint {

namespace {

struct Edge {
  int a;
  int b;
  float score;
};

void check_threshold(float threshold) {
  BANDPRINT_CHECK_MSG(threshold >= kMinThreshold && threshold <= kMaxThreshold,
                      ErrorCode::InvalidParameter,
                      "Threshold " + std::to_string(threshold) + " outside [0.5, 0.95]");
}

int find_root(std::vector<int>& parent, int i) {
  while (parent[i] != i) {
    parent[i] = parent[parent[i]];
    i = parent[i];
  }
  return i;
}

}  // namespace

/// @brief Signature plus its lookup structure, built once per corpus entry.
struct MatchEngine::Prepared {
  const Signature* signature = nullptr;
  LandmarkIndex index;
};

float clamp_threshold(float threshold) { return clamp(threshold, kMinThreshold, kMaxThreshold); }

MatchEngine::MatchEngine(const MatchConfig& config) : config_(config) {
  check_threshold(config.threshold);
  BANDPRINT_CHECK_MSG(config.reference_weight > 0.0f, ErrorCode::InvalidParameter,
                      "Reference weight must be positive");
  BANDPRINT_CHECK_MSG(config.max_shift_seconds >= 0.0f, ErrorCode::InvalidParameter,
                      "Shift window must not be negative");
  BANDPRINT_CHECK_MSG(config.max_results >= 0 && config.num_threads >= 1,
                      ErrorCode::InvalidParameter, "Invalid result cap or thread count");
}

int MatchEngine::shift_frames(const Signature& signature) const {
  return static_cast<int>(std::lround(config_.max_shift_seconds * signature.frame_rate));
}

float MatchEngine::score_prepared(const Prepared& a, const Prepared& b) const {
  const Signature& sa = *a.signature;
  const Signature& sb = *b.signature;
  if (sa.algorithm != sb.algorithm) return 0.0f;
  switch (sa.algorithm) {
    case SignatureAlgorithm::Spectral:
    case SignatureAlgorithm::Lightweight:
      return band_similarity(sa, sb, shift_frames(sa));
    case SignatureAlgorithm::ChromaprintStyle:
    case SignatureAlgorithm::AudfprintStyle:
      return landmark_similarity(a.index, b.index);
  }
  return 0.0f;
}

float MatchEngine::score(const Signature& a, const Signature& b) const {
  Prepared pa{&a, is_landmark_algorithm(a.algorithm) ? LandmarkIndex(a.landmarks) : LandmarkIndex()};
  Prepared pb{&b, is_landmark_algorithm(b.algorithm) ? LandmarkIndex(b.landmarks) : LandmarkIndex()};
  return score_prepared(pa, pb);
}

std::vector<MatchResult> MatchEngine::find_matches(const std::string& query_file,
                                                   const Signature& query,
                                                   const std::vector<CorpusEntry>& corpus,
                                                   SignatureAlgorithm algorithm,
                                                   float threshold) const {
  check_threshold(threshold);
  BANDPRINT_CHECK_MSG(query.algorithm == algorithm, ErrorCode::InvalidParameter,
                      "Query signature algorithm does not match the requested algorithm");

  const bool landmarks = is_landmark_algorithm(algorithm);
  Prepared q{&query, landmarks ? LandmarkIndex(query.landmarks) : LandmarkIndex()};

  std::vector<MatchResult> results;
  for (const auto& entry : corpus) {
    if (entry.signature.algorithm != algorithm) continue;
    if (!config_.include_self && entry.path == query_file) continue;
    Prepared c{&entry.signature,
               landmarks ? LandmarkIndex(entry.signature.landmarks) : LandmarkIndex()};
    float s = score_prepared(q, c);
    if (s < threshold) continue;
    results.push_back({query_file, entry.path, algorithm, s, entry.folder_weight});
  }

  std::sort(results.begin(), results.end(), [](const MatchResult& a, const MatchResult& b) {
    if (a.weighted_score() != b.weighted_score()) return a.weighted_score() > b.weighted_score();
    if (a.score != b.score) return a.score > b.score;
    return a.candidate_file < b.candidate_file;
  });
  if (config_.max_results > 0 && static_cast<int>(results.size()) > config_.max_results) {
    results.resize(config_.max_results);
  }
  return results;
}

std::vector<MatchResult> MatchEngine::find_matches(const std::string& query_file,
                                                   const Signature& query,
                                                   const std::vector<CorpusEntry>& corpus,
                                                   SignatureAlgorithm algorithm) const {
  return find_matches(query_file, query, corpus, algorithm, config_.threshold);
}

std::vector<DuplicateCluster> MatchEngine::find_duplicates(const std::vector<CorpusEntry>& corpus,
                                                           SignatureAlgorithm algorithm,
                                                           float threshold) const {
  check_threshold(threshold);

  const bool landmarks = is_landmark_algorithm(algorithm);
  std::vector<Prepared> prepared;
  std::vector<const CorpusEntry*> entries;
  for (const auto& entry : corpus) {
    if (entry.signature.algorithm != algorithm) continue;
    entries.push_back(&entry);
    prepared.push_back(
        {&entry.signature, landmarks ? LandmarkIndex(entry.signature.landmarks) : LandmarkIndex()});
  }
  const int n = static_cast<int>(prepared.size());

  // Rows are dealt round-robin so long and short rows spread evenly
  auto scan_rows = [&](int first, int stride) {
    std::vector<Edge> edges;
    for (int i = first; i < n; i += stride) {
      for (int j = i + 1; j < n; ++j) {
        float s = score_prepared(prepared[i], prepared[j]);
        if (s >= threshold) edges.push_back({i, j, s});
      }
    }
    return edges;
  };

  std::vector<Edge> edges;
  const int threads = std::max(1, std::min(config_.num_threads, n));
  if (threads == 1) {
    edges = scan_rows(0, 1);
  } else {
    std::vector<std::future<std::vector<Edge>>> parts;
    for (int t = 0; t < threads; ++t) {
      parts.push_back(std::async(std::launch::async, scan_rows, t, threads));
    }
    for (auto& part : parts) {
      std::vector<Edge> found = part.get();
      edges.insert(edges.end(), found.begin(), found.end());
    }
  }

  std::vector<int> parent(n);
  std::iota(parent.begin(), parent.end(), 0);
  for (const auto& e : edges) {
    int ra = find_root(parent, e.a);
    int rb = find_root(parent, e.b);
    if (ra != rb) parent[std::max(ra, rb)] = std::min(ra, rb);
  }

  std::map<int, DuplicateCluster> by_root;
  for (const auto& e : edges) {
    DuplicateCluster& cluster = by_root[find_root(parent, e.a)];
    if (cluster.files.empty()) {
      cluster.algorithm = algorithm;
      cluster.max_score = e.score;
      cluster.min_edge_score = e.score;
    }
    cluster.max_score = std::max(cluster.max_score, e.score);
    cluster.min_edge_score = std::min(cluster.min_edge_score, e.score);
    cluster.files.push_back(entries[e.a]->path);
    cluster.files.push_back(entries[e.b]->path);
  }

  std::vector<DuplicateCluster> clusters;
  for (auto& [root, cluster] : by_root) {
    std::sort(cluster.files.begin(), cluster.files.end());
    cluster.files.erase(std::unique(cluster.files.begin(), cluster.files.end()),
                        cluster.files.end());
    clusters.push_back(std::move(cluster));
  }
  std::sort(clusters.begin(), clusters.end(),
            [](const DuplicateCluster& a, const DuplicateCluster& b) {
              if (a.max_score != b.max_score) return a.max_score > b.max_score;
              return a.files.front() < b.files.front();
            });
  spdlog::debug("Duplicate scan over {} {} signatures: {} edges, {} clusters", n,
                algorithm_id(algorithm), edges.size(), clusters.size());
  return clusters;
}

std::vector<DuplicateCluster> MatchEngine::find_duplicates(const std::vector<CorpusEntry>& corpus,
                                                           SignatureAlgorithm algorithm) const {
  return find_duplicates(corpus, algorithm, config_.threshold);
}

}  // namespace bandprint
