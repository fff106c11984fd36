#ifndef PLATFORM_H
#define PLATFORM_H

#ifdef __EMSCRIPTEN__
  // WASM: log lines go to the browser console
  #include <emscripten/emscripten.h>
#else
  // native: same call sites, printf-style to stderr (stdout carries results)
  #include <cstdio>
  #define EMSCRIPTEN_KEEPALIVE
  #define emscripten_log(x, fmt, ...) fprintf(stderr, fmt "\n", ##__VA_ARGS__)
#endif

#endif // PLATFORM_H
