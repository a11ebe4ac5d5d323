/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_model_ImportExport_h
#define INCLUDED_tsa_model_ImportExport_h

// Symbol visibility for the libTsaModel shared library.  Only Windows needs
// explicit import/export decoration; everywhere else the macro is empty.

#ifdef Windows
#ifdef BUILDING_libTsaModel
#define MODEL_EXPORT __declspec(dllexport)
#else
#define MODEL_EXPORT __declspec(dllimport)
#endif
#else
#define MODEL_EXPORT
#endif

#endif // INCLUDED_tsa_model_ImportExport_h
