#pragma once
#include <stdint.h>

// Absolute grid direction. North is +y, East is +x.
enum Dir : uint8_t { NORTH=0, EAST=1, SOUTH=2, WEST=3, NONE=255 };

// 4-bit wall mask per cell: bit0=N, bit1=E, bit2=S, bit3=W
enum WallMask : uint8_t { WN=1, WE=2, WS=4, WW=8 };

static inline Dir leftOf(Dir d)   { return Dir((uint8_t(d)+3)&3); }
static inline Dir rightOf(Dir d)  { return Dir((uint8_t(d)+1)&3); }
static inline Dir backOf(Dir d)   { return Dir((uint8_t(d)+2)&3); }
static inline Dir opposite(Dir d) { return backOf(d); }

// Turn a relative offset (0=front, 1=right, 2=back, 3=left) into an absolute direction
static inline Dir relativeTo(Dir heading, uint8_t rel) { return Dir((uint8_t(heading)+rel)&3); }

static inline int dx(Dir d) { return (d==EAST) - (d==WEST); }
static inline int dy(Dir d) { return (d==NORTH) - (d==SOUTH); }

static inline uint8_t wallBit(Dir d) { return uint8_t(1u << uint8_t(d)); }

// Letter used by the simulator for walls and headings
static inline char dirLetter(Dir d) {
    switch (d) {
        case NORTH: return 'n';
        case EAST:  return 'e';
        case SOUTH: return 's';
        case WEST:  return 'w';
        default:    return '?';
    }
}

static inline const char* dirName(Dir d) {
    switch (d) {
        case NORTH: return "NORTH";
        case EAST:  return "EAST";
        case SOUTH: return "SOUTH";
        case WEST:  return "WEST";
        default:    return "NONE";
    }
}
