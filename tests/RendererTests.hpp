/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>
#include <QtGui/QImage>

#include <qtermdoc/QTermRenderer.hpp>
#include <qtermdoc/QTermSink.hpp>

#include "FakeDocument.hpp"

#include <cstdio>

namespace RendererTests {
    /*
     * Keeps what the renderer hands over; text goes to the buffer
     */
    class RecordingSink : public QTermSink {
        public:
            RecordingSink( QBuffer *out ) : QTermSink( DirectImage, out ) {
                images = 0;
                clears = 0;
            }

            void emitImage( const QImage& buffer, const QTermPlacement& placement ) {
                images++;
                lastImage     = buffer;
                lastPlacement = placement;
            }

            void clear() {
                clears++;
            }

            int images;
            int clears;
            QImage lastImage;
            QTermPlacement lastPlacement;
    };

    /* A renderer on @doc drawing an 80x24 frame of 10x20 pixel cells */
    class Session {
        public:
            Session( QTermDocument *doc, bool synchronous = true ) : sink( &out ) {
                QTermViewerOptions opts;

                opts.synchronous = synchronous;

                out.open( QIODevice::WriteOnly );

                renderer = new QTermRenderer( opts );
                renderer->setDocument( doc );
                renderer->setFrameSize( 80, 24 );
                renderer->setCellSize( QSize( 10, 20 ) );
                renderer->setSink( &sink );
            }

            ~Session() {
                delete renderer;
            }

            QString output() const {
                return QString::fromUtf8( out.data() );
            }

            void clearOutput() {
                out.buffer().clear();
                out.seek( 0 );
            }

            QBuffer out;
            RecordingSink sink;
            QTermRenderer *renderer;
    };

    inline bool testRenderOnlyWhenDirty() {
        printf( "  testRenderOnlyWhenDirty... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        if ( not s.renderer->renderFrame() or (s.sink.images != 1) ) {
            printf( "FAILED: first frame not produced\n" );
            return false;
        }

        if ( s.sink.lastPlacement.targetCells != QRect( 21, 0, 38, 24 ) ) {
            printf( "FAILED: page not fitted to the frame\n" );
            return false;
        }

        for ( int i = 0; i < 3; i++ ) {
            if ( s.renderer->renderFrame() ) {
                printf( "FAILED: clean state produced a frame\n" );
                return false;
            }
        }

        if ( (doc.renders() != 1) or (s.renderer->framesProduced() != 1) or s.renderer->isDirty() ) {
            printf( "FAILED: %d rasterizations, %d frames\n", doc.renders(), s.renderer->framesProduced() );
            return false;
        }

        /* Setting the same values changes nothing */
        s.renderer->setFrameSize( 80, 24 );
        s.renderer->setZoom( 100 );
        s.renderer->setPage( 0 );

        if ( s.renderer->isDirty() ) {
            printf( "FAILED: unchanged state marked dirty\n" );
            return false;
        }

        s.renderer->markDirty();

        if ( not s.renderer->renderFrame() or (doc.renders() != 1) ) {
            printf( "FAILED: forced redraw must reuse the cached bitmap\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testPanDoesNotRerasterize() {
        printf( "  testPanDoesNotRerasterize... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->setZoom( 200 );

        if ( not s.renderer->renderFrame() ) {
            printf( "FAILED: zoomed frame not produced\n" );
            return false;
        }

        const int renders = doc.renders();

        s.renderer->panBy( 1, 2 );

        if ( not (s.renderer->dirtyReasons() & QTermRenderer::ViewportChanged) ) {
            printf( "FAILED: pan not reported as a viewport change\n" );
            return false;
        }

        if ( not s.renderer->renderFrame() ) {
            printf( "FAILED: panned frame not produced\n" );
            return false;
        }

        if ( doc.renders() != renders ) {
            printf( "FAILED: panning rasterized the page again\n" );
            return false;
        }

        if ( s.sink.lastPlacement.cropRect != QRect( 10, 40, 800, 480 ) ) {
            printf( "FAILED: crop did not follow the pan\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testPanIsClamped() {
        printf( "  testPanIsClamped... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->setZoom( 200 );
        s.renderer->panBy( 1000, 1000 );

        if ( (s.renderer->viewport().panX != 800) or (s.renderer->viewport().panY != 1591) ) {
            printf( "FAILED: pan is %d,%d\n", s.renderer->viewport().panX, s.renderer->viewport().panY );
            return false;
        }

        s.renderer->panBy( -1000, -1000 );

        if ( s.renderer->viewport().isPanned() ) {
            printf( "FAILED: negative pan\n" );
            return false;
        }

        /* Page down moves the frame height minus two rows */
        s.renderer->pageDown();

        if ( s.renderer->viewport().panY != 22 * 20 ) {
            printf( "FAILED: page down moved %d pixels\n", s.renderer->viewport().panY );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testZoomAndReset() {
        printf( "  testZoomAndReset... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->renderFrame();

        s.renderer->setZoom( 200 );
        s.renderer->panBy( 3, 3 );
        s.renderer->zoomIn();

        if ( (s.renderer->viewport().zoomPercent != 225) or s.renderer->viewport().isPanned() ) {
            printf( "FAILED: zoom must start from the top left corner\n" );
            return false;
        }

        s.renderer->setZoom( 1000 );

        if ( s.renderer->viewport().zoomPercent != 400 ) {
            printf( "FAILED: zoom not clamped\n" );
            return false;
        }

        s.renderer->setZoom( 100 );
        s.renderer->renderFrame();

        if ( s.renderer->isDirty() ) {
            printf( "FAILED: state dirty after a frame\n" );
            return false;
        }

        /* Reset always produces a frame, even when nothing changed */
        s.renderer->resetView();

        if ( not s.renderer->renderFrame() ) {
            printf( "FAILED: reset did not redraw\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testPageNavigation() {
        printf( "  testPageNavigation... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->renderFrame();
        s.renderer->nextPage();

        if ( (s.renderer->currentPage() != 1) or not (s.renderer->dirtyReasons() & QTermRenderer::PageChanged) ) {
            printf( "FAILED: page change not tracked\n" );
            return false;
        }

        s.renderer->renderFrame();
        s.renderer->previousPage();
        s.renderer->renderFrame();

        if ( doc.renders() != 2 ) {
            printf( "FAILED: returning to a cached page rasterized it again\n" );
            return false;
        }

        s.renderer->setPage( 99 );
        s.renderer->previousPage();

        if ( s.renderer->currentPage() != 0 ) {
            printf( "FAILED: navigation left the document\n" );
            return false;
        }

        s.renderer->lastPage();

        if ( s.renderer->currentPage() != 2 ) {
            printf( "FAILED: last page\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testFailedPage() {
        printf( "  testFailedPage... " );

        FakeDocument doc;

        doc.setPageLines( 1, { "Caption text." } );
        doc.setFailing( 1 );
        doc.load();

        Session s( &doc );

        int failures = 0;

        QObject::connect( s.renderer, &QTermRenderer::pageFailed, [ &failures ] ( int ) {
            failures++;
        } );

        s.renderer->renderFrame();
        s.renderer->nextPage();
        s.clearOutput();

        if ( not s.renderer->renderFrame() ) {
            printf( "FAILED: no frame for a failing page\n" );
            return false;
        }

        if ( not s.renderer->isPageFailed() or (failures != 1) ) {
            printf( "FAILED: failure not reported\n" );
            return false;
        }

        if ( not s.output().contains( "Page 2 could not be rendered" ) or not s.output().contains( "Caption text." ) ) {
            printf( "FAILED: placeholder or page text missing\n" );
            return false;
        }

        const int renders = doc.renders();

        s.renderer->markDirty();
        s.renderer->renderFrame();

        if ( doc.renders() != renders ) {
            printf( "FAILED: a failed page is retried on every frame\n" );
            return false;
        }

        /* Coming back to the page tries again */
        doc.setFailing( 1, false );

        s.renderer->previousPage();
        s.renderer->renderFrame();
        s.renderer->nextPage();

        const int images = s.sink.images;

        s.renderer->renderFrame();

        if ( s.renderer->isPageFailed() or (s.sink.images != images + 1) ) {
            printf( "FAILED: page not retried after navigating back\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testTextMode() {
        printf( "  testTextMode... " );

        FakeDocument doc;
        QStringList  lines;

        for ( int i = 1; i <= 100; i++ ) {
            lines << QString( "Line %1." ).arg( i );
        }

        doc.setPageLines( 0, lines );
        doc.load();

        Session s( &doc );

        s.renderer->renderFrame();

        const int images = s.sink.images;

        s.renderer->toggleViewMode();

        if ( not (s.renderer->dirtyReasons() & QTermRenderer::ModeChanged) ) {
            printf( "FAILED: mode change not tracked\n" );
            return false;
        }

        s.clearOutput();

        if ( not s.renderer->renderFrame() ) {
            printf( "FAILED: text frame not produced\n" );
            return false;
        }

        if ( (s.sink.images != images) or not s.output().contains( "Line 24." ) or s.output().contains( "Line 25." ) ) {
            printf( "FAILED: text frame content\n" );
            return false;
        }

        if ( s.renderer->textLineCount() != 100 ) {
            printf( "FAILED: %d lines laid out\n", s.renderer->textLineCount() );
            return false;
        }

        s.renderer->pageDown();

        if ( s.renderer->textScroll() != 22 ) {
            printf( "FAILED: page down scrolled %d lines\n", s.renderer->textScroll() );
            return false;
        }

        s.renderer->scrollText( 1000 );

        if ( s.renderer->textScroll() != 76 ) {
            printf( "FAILED: scrolled past the end\n" );
            return false;
        }

        s.renderer->cycleTextMode();

        if ( (s.renderer->textMode() != QTermTextEngine::Raw) or (s.renderer->textScroll() != 0) ) {
            printf( "FAILED: text mode cycle\n" );
            return false;
        }

        /* A page without text offers the way back to images */
        s.renderer->renderFrame();
        s.renderer->nextPage();
        s.clearOutput();
        s.renderer->renderFrame();

        if ( not s.output().contains( "No extractable text on this page (m: image mode)" ) ) {
            printf( "FAILED: scanned page placeholder missing\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testResize() {
        printf( "  testResize... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->renderFrame();
        s.renderer->setFrameSize( 100, 30 );

        if ( not (s.renderer->dirtyReasons() & QTermRenderer::FrameResized) ) {
            printf( "FAILED: resize not tracked\n" );
            return false;
        }

        s.renderer->renderFrame();

        if ( (doc.renders() != 2) or (s.sink.lastPlacement.targetCells.height() != 30) ) {
            printf( "FAILED: page not fitted to the new frame\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testStaleResultsDropped() {
        printf( "  testStaleResultsDropped... " );

        FakeDocument doc;

        doc.setRenderDelay( 50 );
        doc.load();

        Session s( &doc, false );

        int lastPage = -1;

        QObject::connect( s.renderer, &QTermRenderer::frameReady, s.renderer, &QTermRenderer::renderFrame );
        QObject::connect( s.renderer, &QTermRenderer::frameRendered, [ &lastPage ] ( int page ) {
            lastPage = page;
        } );

        if ( s.renderer->renderFrame() ) {
            printf( "FAILED: asynchronous frame produced inline\n" );
            return false;
        }

        /* Move on before the first page arrives */
        s.renderer->nextPage();
        s.renderer->renderFrame();

        QElapsedTimer timer;

        timer.start();

        while ( ( (s.renderer->framesProduced() < 1) or (s.renderer->droppedResults() < 1) ) and (timer.elapsed() < 5000) ) {
            QCoreApplication::processEvents( QEventLoop::AllEvents, 10 );
            QThread::msleep( 5 );
        }

        if ( (s.renderer->framesProduced() != 1) or (s.renderer->droppedResults() != 1) ) {
            printf( "FAILED: %d frames, %d dropped\n", s.renderer->framesProduced(), s.renderer->droppedResults() );
            return false;
        }

        if ( (lastPage != 1) or (s.sink.images != 1) ) {
            printf( "FAILED: the stale page reached the screen\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testReload() {
        printf( "  testReload... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        s.renderer->nextPage();
        s.renderer->renderFrame();

        const quint64 generation = doc.generation();

        doc.reload();

        if ( (doc.generation() == generation) or not (s.renderer->dirtyReasons() & QTermRenderer::DocumentChanged) ) {
            printf( "FAILED: reload not noticed\n" );
            return false;
        }

        if ( s.renderer->currentPage() != 1 ) {
            printf( "FAILED: reload lost the current page\n" );
            return false;
        }

        if ( s.renderer->cache()->count() != 0 ) {
            printf( "FAILED: bitmaps of the old file survived\n" );
            return false;
        }

        s.renderer->renderFrame();

        if ( doc.renders() != 2 ) {
            printf( "FAILED: page not rasterized again after the reload\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testReloadShrinksDocument() {
        printf( "  testReloadShrinksDocument... " );

        FakeDocument doc;

        doc.load();

        Session s( &doc );

        QList<int> pages;

        QObject::connect( s.renderer, &QTermRenderer::currentPageChanged, [ &pages ] ( int page ) {
            pages << page;
        } );

        s.renderer->lastPage();
        s.renderer->renderFrame();

        if ( (s.renderer->currentPage() != 2) or s.renderer->canGoToNextPage() or not s.renderer->canGoToPreviousPage() ) {
            printf( "FAILED: last page\n" );
            return false;
        }

        doc.setPageCount( 2 );
        doc.reload();

        if ( (s.renderer->pageCount() != 2) or (s.renderer->currentPage() != 1) ) {
            printf( "FAILED: page %d of %d after the reload\n", s.renderer->currentPage(), s.renderer->pageCount() );
            return false;
        }

        if ( pages != QList<int>( { 2, 1 } ) ) {
            printf( "FAILED: page changes were not announced\n" );
            return false;
        }

        s.renderer->nextPage();

        if ( s.renderer->currentPage() != 1 ) {
            printf( "FAILED: moved past the end of the document\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testOpenFailure() {
        printf( "  testOpenFailure... " );

        FakeDocument doc;

        doc.setFailLoad( true );
        doc.load();

        QBuffer       out;
        RecordingSink sink( &out );

        QTermViewerOptions opts;

        opts.synchronous = true;

        QTermRenderer         renderer( opts );
        QTermDocument::Error error = QTermDocument::NoError;

        QObject::connect( &renderer, &QTermRenderer::documentFailed, [ &error ] ( QTermDocument::Error err ) {
            error = err;
        } );

        renderer.setSink( &sink );
        renderer.setDocument( &doc );

        if ( error != QTermDocument::InvalidFileFormatError ) {
            printf( "FAILED: open failure not reported\n" );
            return false;
        }

        if ( renderer.renderFrame() or (sink.images != 0) or (renderer.pageCount() != 0) ) {
            printf( "FAILED: a broken document produced a frame\n" );
            return false;
        }

        /** The failure is logged with the file itself, not its directory */
        if ( doc.documentPath() != QFileInfo( "fake.pdf" ).absoluteFilePath() ) {
            printf( "FAILED: document path is %s\n", qPrintable( doc.documentPath() ) );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool runAllTests() {
        printf( "\nRenderer\n" );

        bool allPass = true;

        allPass &= testRenderOnlyWhenDirty();
        allPass &= testPanDoesNotRerasterize();
        allPass &= testPanIsClamped();
        allPass &= testZoomAndReset();
        allPass &= testPageNavigation();
        allPass &= testFailedPage();
        allPass &= testTextMode();
        allPass &= testResize();
        allPass &= testStaleResultsDropped();
        allPass &= testReload();
        allPass &= testReloadShrinksDocument();
        allPass &= testOpenFailure();

        return allPass;
    }
}
