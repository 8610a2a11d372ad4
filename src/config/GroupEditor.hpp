#pragma once

#include "PersistedConfig.hpp"

#include <string>

namespace config
{

enum class EditError
{
    None,
    EmptyName,
    InvalidName, // not valid UTF-8, cannot be stored
    DuplicateName,
    UnknownGroup,
    InvalidRange
};

struct EditResult
{
    EditError error = EditError::None;
    std::string message;
    network::ParseError parse; // filled for InvalidRange

    bool ok() const { return error == EditError::None; }
};

/// Editable draft of a committed PersistedConfig.
///
/// Edits only touch the draft. commit() hands back a complete new config
/// that the owner swaps in as a whole; discarding the editor discards the
/// edits.
class GroupEditor
{
public:
    explicit GroupEditor(PersistedConfig committed);

    EditResult addGroup(ScanGroup group);

    // Renaming keeps the group's stored results under the new name
    EditResult updateGroup(const std::string& originalName, ScanGroup updated);

    // Also drops the group's stored results
    EditResult removeGroup(const std::string& name);

    EditResult setEnabled(const std::string& name, bool enabled);
    EditResult setFilter(const std::string& name, network::DeviceFilter filter);

    // Forget every stored scan result, keeping the groups
    void clearResults();

    bool dirty() const { return dirty_; }
    const PersistedConfig& draft() const { return draft_; }

    PersistedConfig commit();

    /// Name non-empty valid UTF-8 and every range spec parses.
    static EditResult validate(const ScanGroup& group);

private:
    ScanGroup* find(const std::string& name);

    PersistedConfig draft_;
    bool dirty_ = false;
};

} // namespace config
