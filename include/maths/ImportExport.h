/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_maths_ImportExport_h
#define INCLUDED_tsa_maths_ImportExport_h

// Symbol visibility for the libTsaMaths shared library.  Only Windows needs
// explicit import/export decoration; everywhere else the macro is empty.

#ifdef Windows
#ifdef BUILDING_libTsaMaths
#define MATHS_EXPORT __declspec(dllexport)
#else
#define MATHS_EXPORT __declspec(dllimport)
#endif
#else
#define MATHS_EXPORT
#endif

#endif // INCLUDED_tsa_maths_ImportExport_h
