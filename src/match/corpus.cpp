#include "match/corpus.h"

#include "store/fingerprint_store.h"

namespace bandprint {

std::vector<CorpusEntry> build_corpus(const std::vector<const FingerprintStore*>& stores,
                                      SignatureAlgorithm algorithm, float reference_weight) {
  std::vector<CorpusEntry> corpus;
  for (const FingerprintStore* store : stores) {
    if (store == nullptr || store->ignores_fingerprints()) continue;
    const float weight = store->is_reference_folder() ? reference_weight : 1.0f;
    for (const auto& filename : store->filenames()) {
      if (store->is_excluded(filename) || store->is_stale(filename, algorithm)) continue;
      auto signature = store->get(filename, algorithm);
      if (!signature) continue;
      CorpusEntry entry;
      entry.path = store->path_of(filename);
      entry.folder = store->folder();
      entry.filename = filename;
      entry.folder_weight = weight;
      entry.signature = std::move(*signature);
      corpus.push_back(std::move(entry));
    }
  }
  return corpus;
}

}  // namespace bandprint
