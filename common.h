/************************************************************************/
/*                                                                      */
/*    lrvutil - convert EAC 360 degree video to dual fisheye LRV layout */
/*                                                                      */
/*            Copyright 2024 by Kay F. Jahnke                           */
/*                                                                      */
/*    The git repository for this software is at                        */
/*                                                                      */
/*    https://github.com/kfjahnke/envutil                               */
/*                                                                      */
/*    Please direct questions, bug reports, and contributions to        */
/*                                                                      */
/*    kfjahnke+envutil@gmail.com                                        */
/*                                                                      */
/*    Permission is hereby granted, free of charge, to any person       */
/*    obtaining a copy of this software and associated documentation    */
/*    files (the "Software"), to deal in the Software without           */
/*    restriction, including without limitation the rights to use,      */
/*    copy, modify, merge, publish, distribute, sublicense, and/or      */
/*    sell copies of the Software, and to permit persons to whom the    */
/*    Software is furnished to do so, subject to the following          */
/*    conditions:                                                       */
/*                                                                      */
/*    The above copyright notice and this permission notice shall be    */
/*    included in all copies or substantial portions of the             */
/*    Software.                                                         */
/*                                                                      */
/*    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND    */
/*    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES   */
/*    OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND          */
/*    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT       */
/*    HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,      */
/*    WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING      */
/*    FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR     */
/*    OTHER DEALINGS IN THE SOFTWARE.                                   */
/*                                                                      */
/************************************************************************/

// this header has code common to the entire program: the small vector
// type used for frame sizes and circle centres, timing helpers and the
// cancellation flag shared between the batch scheduler and the engine
// invocations it has in flight.

#ifndef LRVUTIL_COMMON_H
#define LRVUTIL_COMMON_H

#include <atomic>
#include <chrono>

#include <Imath/ImathVec.h>

namespace lrvutil
{

// Imath types for 2D integer coordinates and extents

typedef Imath::V2i v2i_t ;

typedef std::chrono::steady_clock::time_point lrv_time_t ;

#define LRVUTIL_NOW() std::chrono::steady_clock::now()

inline double seconds_between ( const lrv_time_t & a ,
                                const lrv_time_t & b )
{
  return std::chrono::duration < double > ( b - a ) . count() ;
}

// cancel_token_t is set once and stays set. The flag is a lock-free
// atomic, so cancel() may be called from a signal handler.

class cancel_token_t
{
  std::atomic < bool > flag { false } ;

public:

  void cancel()
  {
    flag.store ( true ) ;
  }

  void reset()
  {
    flag.store ( false ) ;
  }

  bool cancelled() const
  {
    return flag.load() ;
  }
} ;

} ; // namespace lrvutil

#endif // LRVUTIL_COMMON_H
