/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_api_ImportExport_h
#define INCLUDED_tsa_api_ImportExport_h

// Symbol visibility for the libTsaApi shared library.  Only Windows needs
// explicit import/export decoration; everywhere else the macro is empty.

#ifdef Windows
#ifdef BUILDING_libTsaApi
#define API_EXPORT __declspec(dllexport)
#else
#define API_EXPORT __declspec(dllimport)
#endif
#else
#define API_EXPORT
#endif

#endif // INCLUDED_tsa_api_ImportExport_h
