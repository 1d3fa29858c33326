#pragma once

/*here you can choose the built-in prompt defaults*/

#ifndef MP_DEFAULT_PAGE_SIZE
#define MP_DEFAULT_PAGE_SIZE 7
#endif

#ifndef MP_DEFAULT_VIM_MODE
#define MP_DEFAULT_VIM_MODE 0
#endif

/* delay (ms) before a lone ESC byte is treated as the Escape key */
#ifndef MP_ESC_DELAY_MS
#define MP_ESC_DELAY_MS 25
#endif

#define MP_RC_FILE_NAME ".mpromptrc"
#define MP_RC_ENV       "MPROMPT_RC"
#define MP_LOG_ENV      "MPROMPT_LOG"
