#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sage_core/index/index_backend.hpp"
#include "sage_core/remote/remote_index_client.hpp"

namespace sage_core {

// One named index on the remote service, exposed as an IndexBackend.
class RemoteIndex : public IndexBackend {
 public:
  RemoteIndex(std::shared_ptr<RemoteIndexClient> client, const std::string &index_name);

  void add(const std::vector<VectorRecord> &records) override;
  std::vector<ScoredId> query(const std::vector<float> &vector, size_t k) override;
  std::string name() const override {
    return "remote";
  }

  const std::string &index_name() const {
    return index_name_;
  }

 private:
  std::shared_ptr<RemoteIndexClient> client_;
  std::string index_name_;
};

}  // namespace sage_core
