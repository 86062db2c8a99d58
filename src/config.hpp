#pragma once

/*compile-time editor defaults*/

#define VIBE_MODE_INSERT 1
#define VIBE_MODE_NORMAL 2

#ifndef VIBE_INITIAL_MODE
#define VIBE_INITIAL_MODE VIBE_MODE_INSERT
#endif

#if VIBE_INITIAL_MODE == VIBE_MODE_NORMAL
#define VIBE_INITIAL_MODE_VALUE Mode::Normal
#else
#define VIBE_INITIAL_MODE_VALUE Mode::Insert
#endif

#ifndef VIBE_RC_NAME
#define VIBE_RC_NAME ".viberc"
#endif

#ifndef VIBE_WRITE_CHUNK_SIZE
#define VIBE_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#define VIBE_BANNER "Welcome to vibe a.k.a. vi Barebones Editor"
