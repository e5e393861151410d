#pragma once

#include <optional>
#include <string>

namespace tgdrive::ctl {

/// Verify the stored bot credential and storage chat
int exec_check();

/// Create a folder and print its id
int exec_mkdir(const std::string& name, const std::optional<std::string>& parent_id);

/// Upload a local file chunk by chunk
int exec_upload(const std::string& file_path, const std::optional<std::string>& parent_id, const std::string& mime_type);

/// Continue an interrupted upload of `item_id` from the same local file
int exec_resume(const std::string& item_id, const std::string& file_path);

/// Stream an item (or a "start-end" byte range of it) to a file or stdout
int exec_download(const std::string& item_id, const std::string& output, const std::string& range);

/// Delete an item, its descendants and their provider messages
int exec_rm(const std::string& item_id);

}  // namespace tgdrive::ctl
