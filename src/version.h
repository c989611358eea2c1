#ifndef VERSION_H_INCLUDED
#define VERSION_H_INCLUDED

#define VERSION "v0.3.1"

#endif // VERSION_H_INCLUDED
