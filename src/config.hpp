#pragma once

/*defaults for the history engine; runtime values come from HistoryConfig*/

#define SCRIBE_DEFAULT_HOT_CAPACITY      500
#define SCRIBE_DEFAULT_MAX_HISTORY_DEPTH 10000
#define SCRIBE_DEFAULT_GROUP_TIMEOUT_MS  500

#define SCRIBE_DATA_DIR_ENV   "SCRIBE_DATA_DIR"
#define SCRIBE_DATA_DIR_NAME  ".data"
#define SCRIBE_HISTORY_DB     "history.db"
#define SCRIBE_SESSION_DB     "scribe-session.db"
#define SCRIBE_RC_NAME        ".scriberc"
#define SCRIBE_LOCK_SUFFIX    ".lock"

/*bumped whenever the on-disk encoding of groups/meta/session changes*/
#define SCRIBE_CODEC_VERSION 1
