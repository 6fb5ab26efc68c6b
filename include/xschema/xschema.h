/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/xschema.h
 * \brief The header for the support of translating between JSON Schema and the type language.
 */
#ifndef XSCHEMA_XSCHEMA_H_
#define XSCHEMA_XSCHEMA_H_

#include <xschema/ast.h>
#include <xschema/exception.h>
#include <xschema/jsonschema.h>
#include <xschema/value.h>

#endif  // XSCHEMA_XSCHEMA_H_
