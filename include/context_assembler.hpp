#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedding_service.hpp"
#include "network_monitor.hpp"
#include "storage/context_store.hpp"
#include "types.hpp"
#include "workspace.hpp"

namespace context_engine {

struct ContextRequest {
    std::string query;
    ContextType context_type = ContextType::Chat;
    std::vector<ContextSource> sources = {ContextSource::ActiveFile, ContextSource::Workspace};
    std::optional<int> max_tokens;
    bool include_project_info = false;
    std::optional<std::string> conversation_id;
    bool selection_only = false;
    std::optional<int> limit_files;
};

ContextRequest context_request_from_json(const nlohmann::json& j);

class ContextAssembler {
public:
    ContextAssembler(AssemblyConfig config,
                     std::shared_ptr<ContextStore> store,
                     std::shared_ptr<EmbeddingService> embeddings,
                     std::shared_ptr<NetworkStatus> network,
                     std::shared_ptr<WorkspaceProvider> workspace);

    // Never throws; any failure yields an empty result.
    ContextResult assemble_context(const ContextRequest& request);

    // Gives every item a relevance and sorts descending (stable).
    std::vector<ContextItem> score_items(std::vector<ContextItem> items, const std::string& query);

    // Greedy walk in the given order. Stops at the first overflow unless
    // nothing was accepted yet, in which case that first item is cut down.
    ContextResult fit_to_budget(const std::vector<ContextItem>& ranked, int max_tokens) const;

    int estimate_tokens(const ContextItem& item) const;
    ContextItem truncate_to_fit(const ContextItem& item, int max_tokens) const;

    int default_max_tokens(ContextType type) const;

private:
    std::vector<ContextItem> active_file_items(bool selection_only);
    std::vector<ContextItem> open_file_items(int limit);
    std::vector<ContextItem> workspace_items(const std::string& query, int limit);
    std::vector<ContextItem> history_items(const std::optional<std::string>& conversation_id);
    std::optional<ContextItem> project_info();

    AssemblyConfig config_;
    std::shared_ptr<ContextStore> store_;
    std::shared_ptr<EmbeddingService> embeddings_;
    std::shared_ptr<NetworkStatus> network_;
    std::shared_ptr<WorkspaceProvider> workspace_;
};

} // namespace context_engine
