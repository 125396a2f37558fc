#pragma once

/* Report an unrecoverable error: stderr always, and a message box if there's
   a display to put one on. Doesn't exit; callers decide. */
void system_failure(const char *message);
