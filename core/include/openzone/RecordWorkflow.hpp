// Operator write path: add/edit/delete actions run their dialog through the
// ModalHost and hand the outcome to the dispatcher.
#pragma once
#include "Interaction.hpp"
#include "MutationDispatcher.hpp"
#include "RecordForm.hpp"
#include "TreeStore.hpp"
#include <optional>
#include <string>

namespace openzone {

struct EditRequest {
    std::string zoneName;
    std::optional<Record> existing; // empty when creating
    RecordFields fields;            // seeded values
};

// Implemented by the UI. Each call must eventually resume or cancel the
// interaction it was given, exactly once.
class ModalHost {
public:
    virtual ~ModalHost() = default;
    virtual void confirmDelete(const std::string &recordLabel,
                               Interaction<bool> reply) = 0;
    virtual void editRecord(const EditRequest &request,
                            Interaction<MutationPayload> reply) = 0;
};

class RecordWorkflow {
public:
    RecordWorkflow(TreeStore &store, ModalHost &host,
                   MutationDispatcher &dispatcher, NotificationSink &sink);

    // Each returns false when the cursor does not allow the action.
    bool addRecord(TreeNode *cursor);
    bool editRecord(TreeNode *cursor);
    bool deleteRecord(TreeNode *cursor);

private:
    TreeStore &store_;
    ModalHost &host_;
    MutationDispatcher &dispatcher_;
    NotificationSink &sink_;
};

} // namespace openzone
