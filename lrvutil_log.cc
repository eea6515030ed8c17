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

#include <atomic>
#include <iostream>
#include <mutex>

#include "lrvutil_log.h"

namespace lrvutil
{

namespace
{
  std::atomic < bool > verbose_flag { false } ;
  std::mutex output_mutex ;

  void emit ( std::ostream & osr ,
              const char * prefix ,
              const std::string & message )
  {
    std::lock_guard < std::mutex > lock ( output_mutex ) ;
    osr << prefix << message << std::endl ;
  }
} ;

void set_verbose ( bool verbose )
{
  verbose_flag.store ( verbose ) ;
}

bool is_verbose()
{
  return verbose_flag.load() ;
}

void log_info ( const std::string & message )
{
  emit ( std::cout , "" , message ) ;
}

void log_warning ( const std::string & message )
{
  emit ( std::cerr , "warning: " , message ) ;
}

void log_error ( const std::string & message )
{
  emit ( std::cerr , "error: " , message ) ;
}

void log_debug ( const std::string & message )
{
  if ( verbose_flag.load() )
    emit ( std::cout , "  " , message ) ;
}

} ; // namespace lrvutil
