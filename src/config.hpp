#pragma once

/*compile-time defaults; override with -D on the compiler command line*/

#define PT_PAGE_A4     1
#define PT_PAGE_LETTER 2

#ifndef PT_PAGE_SIZE
#define PT_PAGE_SIZE PT_PAGE_A4
#endif

#if PT_PAGE_SIZE == PT_PAGE_LETTER
#define PT_PAGE_WIDTH  612.0f
#define PT_PAGE_HEIGHT 792.0f
#define PT_PAGE_NAME "letter"
#else
#define PT_PAGE_WIDTH  595.276f
#define PT_PAGE_HEIGHT 841.89f
#define PT_PAGE_NAME "a4"
#endif

#ifndef PT_WRITE_CHUNK_SIZE
#define PT_WRITE_CHUNK_SIZE (1 << 16)
#endif

#define PT_RC_FILE ".pagetabrc"
