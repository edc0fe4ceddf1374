#pragma once

/*here you can override the pager defaults at build time*/

#ifndef MPAGE_DEFAULT_LINES
#define MPAGE_DEFAULT_LINES 5
#endif

#ifndef MPAGE_DEFAULT_TAB_WIDTH
#define MPAGE_DEFAULT_TAB_WIDTH 4
#endif

#define MPAGE_MAX_TAB_WIDTH 32

/* how long the watcher blocks before re-checking (ms) */
#ifndef MPAGE_WATCH_TIMEOUT_MS
#define MPAGE_WATCH_TIMEOUT_MS 60000
#endif

/* how long the initial pipe load waits for each chunk (ms) */
#ifndef MPAGE_PIPE_WAIT_MS
#define MPAGE_PIPE_WAIT_MS 300
#endif

/* wait after ESC before deciding it was a lone Escape key (ms) */
#ifndef MPAGE_ESC_DELAY_MS
#define MPAGE_ESC_DELAY_MS 25
#endif

#define MPAGE_STDIN_PLACEHOLDER "-"
#define MPAGE_LOGGER_NAME "mpage"
