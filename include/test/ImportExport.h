/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_test_ImportExport_h
#define INCLUDED_tsa_test_ImportExport_h

// Symbol visibility for the libTsaTest shared library.  Only Windows needs
// explicit import/export decoration; everywhere else the macro is empty.

#ifdef Windows
#ifdef BUILDING_libTsaTest
#define TEST_EXPORT __declspec(dllexport)
#else
#define TEST_EXPORT __declspec(dllimport)
#endif
#else
#define TEST_EXPORT
#endif

#endif // INCLUDED_tsa_test_ImportExport_h
