//------------------------------------------------------------------------------
// Copyright (c) 2024 by European Organization for Nuclear Research (CERN)
// See the LICENCE file for details.
//------------------------------------------------------------------------------

#ifndef __CPPUNIT_GSI_CRED_HELPERS_HH__
#define __CPPUNIT_GSI_CRED_HELPERS_HH__

#include "GsiCred/GsiCredStatus.hh"
#include <errno.h>
#include <string.h>

#define CPPUNIT_ASSERT_GSIST( x )                    \
{                                                    \
  GsiCred::Status st = x;                            \
  std::string msg = "["; msg += #x; msg += "]: ";    \
  msg += st.ToStr();                                 \
  CPPUNIT_ASSERT_MESSAGE( msg, st.IsOK() );          \
}

#define CPPUNIT_ASSERT_GSIERR( x, err )              \
{                                                    \
  GsiCred::Status st = x;                            \
  std::string msg = "["; msg += #x; msg += "]: ";    \
  msg += st.ToStr();                                 \
  CPPUNIT_ASSERT_MESSAGE( msg, st.IsError() );       \
  CPPUNIT_ASSERT_MESSAGE( msg, st.code == err );     \
}

#define CPPUNIT_ASSERT_ERRNO( x )                    \
{                                                    \
  std::string msg = "["; msg += #x; msg += "]: ";    \
  msg += strerror( errno );                          \
  CPPUNIT_ASSERT_MESSAGE( msg, x );                  \
}

#endif // __CPPUNIT_GSI_CRED_HELPERS_HH__
