#include "sage_core/remote/remote_index.hpp"

namespace sage_core {

RemoteIndex::RemoteIndex(std::shared_ptr<RemoteIndexClient> client, const std::string &index_name)
    : client_(std::move(client)), index_name_(index_name) {}

void RemoteIndex::add(const std::vector<VectorRecord> &records) {
  client_->insert(index_name_, records);
}

std::vector<ScoredId> RemoteIndex::query(const std::vector<float> &vector, size_t k) {
  return client_->search(index_name_, vector, k);
}

}  // namespace sage_core
