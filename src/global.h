#ifndef LINEUP_GLOBAL_H
#define LINEUP_GLOBAL_H 1

// Verbose tracing on stderr; stdout carries only rendered output.
constexpr bool DEBUG = false;

#endif /* !LINEUP_GLOBAL_H */
