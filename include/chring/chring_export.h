/* chring DLL Export/Import Macros */
/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#ifndef CHRING_EXPORT_H
#define CHRING_EXPORT_H

/* Symbol visibility and DLL export/import macros */
#if defined(_WIN32) || defined(__CYGWIN__)
    #ifdef CHR_BUILDING_DLL
        #ifdef __GNUC__
            #define CHR_EXPORT __attribute__((dllexport))
        #else
            #define CHR_EXPORT __declspec(dllexport)
        #endif
    #elif defined(CHR_USING_DLL)
        #ifdef __GNUC__
            #define CHR_EXPORT __attribute__((dllimport))
        #else
            #define CHR_EXPORT __declspec(dllimport)
        #endif
    #else
        /* Static library */
        #define CHR_EXPORT
    #endif
#else
    #if defined(__GNUC__) && __GNUC__ >= 4
        #define CHR_EXPORT __attribute__((visibility("default")))
    #else
        #define CHR_EXPORT
    #endif
#endif

/* Calling convention (Windows-specific) */
#if defined(_WIN32) && !defined(__GNUC__)
    #define CHR_CALL __cdecl
#else
    #define CHR_CALL
#endif

#endif /* CHRING_EXPORT_H */
