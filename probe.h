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

// container inspection. The job runner needs three facts about a media
// file: whether it can be opened at all, the frame size of its first
// video stream and whether there is an audio stream. media_probe_t is
// the interface, libav_probe_t answers with libavformat. Tests plug in
// their own probe to go with a mock engine.

#ifndef LRVUTIL_PROBE_H
#define LRVUTIL_PROBE_H

#include <iostream>
#include <string>

namespace lrvutil
{

struct media_info_t
{
  bool valid = false ;
  bool has_video = false ;
  bool has_audio = false ;
  int width = 0 ;
  int height = 0 ;
  double duration = 0.0 ;    // seconds, 0 if unknown
  std::string error ;        // why valid is false

  friend std::ostream & operator<<
    ( std::ostream & osr , const media_info_t & info )
  {
    if ( ! info.valid )
      return osr << "media { invalid: " << info.error << " }" ;
    osr << "media { " << info.width << "x" << info.height
        << ( info.has_audio ? " +audio" : " no audio" )
        << " " << info.duration << "s }" ;
    return osr ;
  }
} ;

struct media_probe_t
{
  virtual ~media_probe_t() = default ;

  // never throws: failures come back with valid == false

  virtual media_info_t probe ( const std::string & path ) const = 0 ;
} ;

struct libav_probe_t
: public media_probe_t
{
  libav_probe_t() ;

  media_info_t probe ( const std::string & path ) const override ;
} ;

} ; // namespace lrvutil

#endif // LRVUTIL_PROBE_H
