#include "openzone/RecordWorkflow.hpp"
#include <utility>

namespace openzone {

RecordWorkflow::RecordWorkflow(TreeStore &store, ModalHost &host,
                               MutationDispatcher &dispatcher,
                               NotificationSink &sink)
    : store_(store), host_(host), dispatcher_(dispatcher), sink_(sink) {}

bool RecordWorkflow::addRecord(TreeNode *cursor) {
    TreeNode *parent = store_.findContainingParent(cursor);
    if (!parent) {
        sink_.notify("Add record", "Select a zone first", Severity::Warning);
        return false;
    }

    EditRequest req;
    req.zoneName = parent->label();
    req.fields = RecordForm::seed(req.zoneName, std::nullopt);

    const std::string zoneId = parent->id();
    MutationDispatcher &dispatcher = dispatcher_;
    host_.editRecord(
        req, Interaction<MutationPayload>(
                 [&dispatcher, zoneId](std::optional<MutationPayload> p) {
                     if (!p)
                         return;
                     dispatcher.submit(
                         MutationRequest::create(zoneId, std::move(*p)));
                 }));
    return true;
}

bool RecordWorkflow::editRecord(TreeNode *cursor) {
    if (!cursor || cursor->kind() != NodeKind::ChildNode || !cursor->record()) {
        sink_.notify("Edit record", "Select a record first",
                     Severity::Warning);
        return false;
    }
    TreeNode *parent = store_.findContainingParent(cursor);
    if (!parent)
        return false;

    EditRequest req;
    req.zoneName = parent->label();
    req.existing = *cursor->record();
    req.fields = RecordForm::seed(req.zoneName, req.existing);

    const std::string zoneId = parent->id();
    const std::string recordId = cursor->id();
    TreeStore &store = store_;
    NotificationSink &sink = sink_;
    MutationDispatcher &dispatcher = dispatcher_;
    host_.editRecord(
        req, Interaction<MutationPayload>(
                 [&store, &sink, &dispatcher, zoneId,
                  recordId](std::optional<MutationPayload> p) {
                     if (!p)
                         return;
                     // The zone may have been reloaded while the dialog
                     // was open.
                     if (!store.findChild(zoneId, recordId)) {
                         sink.notify("Edit record",
                                     "The record is no longer listed",
                                     Severity::Warning);
                         return;
                     }
                     dispatcher.submit(MutationRequest::update(
                         zoneId, recordId, std::move(*p)));
                 }));
    return true;
}

bool RecordWorkflow::deleteRecord(TreeNode *cursor) {
    if (!cursor || cursor->kind() != NodeKind::ChildNode || !cursor->record()) {
        sink_.notify("Delete record", "Select a record first",
                     Severity::Warning);
        return false;
    }
    TreeNode *parent = store_.findContainingParent(cursor);
    if (!parent)
        return false;

    const std::string zoneId = parent->id();
    const std::string recordId = cursor->id();
    const std::string label = cursor->label();
    TreeStore &store = store_;
    NotificationSink &sink = sink_;
    MutationDispatcher &dispatcher = dispatcher_;
    host_.confirmDelete(
        label, Interaction<bool>([&store, &sink, &dispatcher, zoneId, recordId,
                                  label](std::optional<bool> accepted) {
            if (!accepted.value_or(false))
                return;
            if (!store.findChild(zoneId, recordId)) {
                sink.notify("Delete record", "The record is no longer listed",
                            Severity::Warning);
                return;
            }
            dispatcher.submit(MutationRequest::remove(zoneId, recordId, label));
        }));
    return true;
}

} // namespace openzone
