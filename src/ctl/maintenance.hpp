#pragma once

namespace tgdrive::ctl {

/// Drop upload sessions idle for longer than the configured TTL
int exec_sessions_reap();

/// List provider messages whose deletion is still pending
int exec_deletes_list();

/// Retry pending message deletions that are due
int exec_deletes_retry();

}  // namespace tgdrive::ctl
